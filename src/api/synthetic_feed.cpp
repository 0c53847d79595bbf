#include "api/synthetic_feed.hpp"

#include <array>
#include <cstdio>

namespace api {

namespace {

constexpr std::array<const char*, 8> recipients = {
    "M. Perez", "C. Barnard", "S. Card", "C. Baxter", "L. Prouse", "J. Roberts", "H. Haley", "R. Adams"};

constexpr std::array<const char*, 4> templates = {
    "Received %lld EUR on %s, recipient %s, acc. no. %s, amount EUR %lld, fees EUR 1",
    "EUR %lld on %s by INTERNATIONAL transfer credited to %s (%s), amount EUR %lld.",
    "%lld EUR am %s an %s, Empfaengerkonto %s, amount %lld EUR",
    "Got %lld on %s from payroll to %s, r. acc. %s, oryg. amount %lld, fees 2 quid."};

std::string format_date(int days_offset, int year, int month, int day) {
    // Calendar arithmetic is only needed within a month; day stays in 1..28.
    day += days_offset;
    if (day > 28) day -= 28;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

} // namespace

std::uint64_t SyntheticFeed::uniform(std::uint64_t lo, std::uint64_t hi) {
    return std::uniform_int_distribution<std::uint64_t>(lo, hi)(rng_);
}

SyntheticFeed::Transfer SyntheticFeed::next(core::RecordId id) {
    const auto amount = static_cast<long long>(uniform(1000, 9999));
    const int year = static_cast<int>(uniform(2014, 2024));
    const int month = static_cast<int>(uniform(1, 12));
    const int day = static_cast<int>(uniform(1, 28));
    const char* recipient = recipients[uniform(0, recipients.size() - 1)];

    char acc[32];
    std::snprintf(acc, sizeof(acc), "PL%02llu%012llu%012llu", static_cast<unsigned long long>(uniform(10, 99)),
                  static_cast<unsigned long long>(uniform(0, 999'999'999'999ULL)),
                  static_cast<unsigned long long>(uniform(0, 999'999'999'999ULL)));
    const std::string acc_str = acc;
    const std::string acc_tail = acc_str.substr(acc_str.size() - 12);

    Transfer t{};
    t.left.side = core::Side::Left;
    t.left.op = core::DeltaOp::Insert;
    t.left.id = id;
    t.left.fields = {
        {"date", format_date(0, year, month, day)},
        {"amount", std::to_string(amount)},
        {"recipient", recipient},
        {"recipient_acc_no", acc_str},
    };

    const long long noisy_amount = amount - static_cast<long long>(uniform(0, 8));
    const std::string noisy_date = format_date(static_cast<int>(uniform(0, 2)), year, month, day);
    const auto tmpl = uniform(0, templates.size() - 1);
    char desc[256];
    if (tmpl == 1) {
        std::snprintf(desc, sizeof(desc), templates[tmpl], noisy_amount, noisy_date.c_str(), acc_tail.c_str(),
                      recipient, amount);
    } else {
        std::snprintf(desc, sizeof(desc), templates[tmpl], noisy_amount, noisy_date.c_str(), recipient,
                      acc_tail.c_str(), amount);
    }

    t.right.side = core::Side::Right;
    t.right.op = core::DeltaOp::Insert;
    t.right.id = id;
    t.right.fields = {{"description", desc}};
    return t;
}

core::DeltaEvent SyntheticFeed::remove(core::Side side, core::RecordId id) {
    core::DeltaEvent ev{};
    ev.side = side;
    ev.op = core::DeltaOp::Remove;
    ev.id = id;
    return ev;
}

} // namespace api
