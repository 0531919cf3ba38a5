#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace NR {

enum class CheckKind {
    Nsid,
    Fragment,
    Reference
};

struct CheckOptions {
    CheckKind                kind      = CheckKind::Reference;
    bool                     json      = false;
    bool                     quiet     = false;
    bool                     readStdin = false;
    bool                     showHelp  = false;
    int                      indent    = 2;
    std::vector<std::string> inputs;
};

inline constexpr int kCheckExitValid   = 0;
inline constexpr int kCheckExitInvalid = 1;
inline constexpr int kCheckExitUsage   = 2;

void printCheckUsage(std::ostream& out);

// Option errors are written to `err`; nullopt means the command line was unusable.
auto parseCheckOptions(int argc, char const* const* argv, std::ostream& err) -> std::optional<CheckOptions>;

/**
 * Checks every input and reports on `out`, one "ok <input>" or
 * "error <input>: <label>:<message>" line each, or a single JSON array.
 * Returns kCheckExitValid when all inputs parse, kCheckExitInvalid when any
 * is rejected and kCheckExitUsage when there is nothing to check.
 */
auto runCheck(CheckOptions options, std::istream& in, std::ostream& out, std::ostream& err) -> int;

} // namespace NR
