#include "DateCli.hpp"
#include <charconv>
#include <string>
#include <system_error>

namespace {

void print_help(std::ostream& os) {
    os <<
R"(Usage:
  plaindate today [--utc]
  plaindate valid <YYYY-MM-DD>
  plaindate add <YYYY-MM-DD> <days>
  plaindate sub <YYYY-MM-DD> <days>
  plaindate diff <from YYYY-MM-DD> <to YYYY-MM-DD>
  plaindate weekday <YYYY-MM-DD>
  plaindate between <YYYY-MM-DD> <from YYYY-MM-DD> <to YYYY-MM-DD>
  plaindate leap <year>
)";
}

} // namespace

namespace plaindate::cli {

static bool parseIntArg(std::string_view s, int& out) {
    if (s.empty()) return false;
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, out);
    return ec == std::errc() && ptr == end;
}

// Parses a date argument, reporting the error on `err` when it is rejected.
static bool parseDateArg(std::string_view s, PlainDate& out, std::ostream& err) {
    try {
        out = PlainDate::fromISOString(s);
        return true;
    } catch (const DateError& e) {
        err << "[plaindate] " << e.what() << "\n";
        return false;
    }
}

static const char* yesNo(bool b) { return b ? "yes" : "no"; }

int run(std::span<const std::string_view> args,
        std::ostream& out,
        std::ostream& err,
        const NowFunction& now) {
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_help(out);
        return 0;
    }

    const std::string_view cmd = args[0];

    if (cmd == "today") {
        const bool utc = args.size() == 2 && args[1] == "--utc";
        if (args.size() > 2 || (args.size() == 2 && !utc)) { print_help(err); return 1; }
        const PlainDate d = utc ? PlainDate::fromUTCInstant(now()) : PlainDate::today(now);
        out << d << "\n";
        return 0;
    }

    if (cmd == "valid") {
        if (args.size() != 2) { print_help(err); return 1; }
        try {
            (void)PlainDate::fromISOString(args[1]);
        } catch (const DateError& e) {
            out << "invalid: " << e.what() << "\n";
            return 2;
        }
        out << "valid\n";
        return 0;
    }

    if (cmd == "add" || cmd == "sub") {
        if (args.size() != 3) { print_help(err); return 1; }
        PlainDate d;
        if (!parseDateArg(args[1], d, err)) return 2;

        int days = 0;
        if (!parseIntArg(args[2], days)) {
            err << "[plaindate] Invalid day count: " << args[2] << "\n";
            return 2;
        }

        out << (cmd == "add" ? d.addDays(days) : d.subDays(days)) << "\n";
        return 0;
    }

    if (cmd == "diff") {
        if (args.size() != 3) { print_help(err); return 1; }
        PlainDate from, to;
        if (!parseDateArg(args[1], from, err) || !parseDateArg(args[2], to, err)) return 2;
        out << from.getDaysDifference(to) << "\n";
        return 0;
    }

    if (cmd == "weekday") {
        if (args.size() != 2) { print_help(err); return 1; }
        PlainDate d;
        if (!parseDateArg(args[1], d, err)) return 2;
        out << d.getDayOfWeekStr() << "\n";
        return 0;
    }

    if (cmd == "between") {
        if (args.size() != 4) { print_help(err); return 1; }
        PlainDate d, from, to;
        if (!parseDateArg(args[1], d, err) ||
            !parseDateArg(args[2], from, err) ||
            !parseDateArg(args[3], to, err)) return 2;
        out << yesNo(d.isInInterval(from, to)) << "\n";
        return 0;
    }

    if (cmd == "leap") {
        if (args.size() != 2) { print_help(err); return 1; }
        int year = 0;
        if (!parseIntArg(args[1], year)) {
            err << "[plaindate] Invalid year: " << args[1] << "\n";
            return 2;
        }
        out << yesNo(PlainDate::isLeapYear(year)) << "\n";
        return 0;
    }

    err << "Unknown command: " << cmd << "\n\n";
    print_help(err);
    return 2;
}

} // namespace plaindate::cli
