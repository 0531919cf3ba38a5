#include "tools/NsidCheck.hpp"

#include "cli/CommandLine.hpp"
#include "core/Error.hpp"
#include "nsid/Fragment.hpp"
#include "nsid/Nsid.hpp"
#include "nsid/Reference.hpp"
#include "tools/NsidJson.hpp"
#include "utils/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <istream>
#include <ostream>
#include <string_view>
#include <utility>

namespace NR {

namespace {

auto parse_kind(std::string_view text) -> std::optional<CheckKind> {
    if (text == "nsid")
        return CheckKind::Nsid;
    if (text == "fragment")
        return CheckKind::Fragment;
    if (text == "reference")
        return CheckKind::Reference;
    return std::nullopt;
}

auto check_input(std::string_view input, CheckKind kind) -> Expected<nlohmann::json> {
    switch (kind) {
        case CheckKind::Nsid: {
            auto nsid = Nsid::parse(input);
            if (!nsid)
                return std::unexpected(nsid.error());
            return describeNsid(*nsid);
        }
        case CheckKind::Fragment: {
            auto fragment = Fragment::parse(input);
            if (!fragment)
                return std::unexpected(fragment.error());
            return describeFragment(*fragment);
        }
        case CheckKind::Reference: {
            auto reference = Reference::parse(input);
            if (!reference)
                return std::unexpected(reference.error());
            return describeReference(*reference);
        }
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unhandled input kind"});
}

} // namespace

void printCheckUsage(std::ostream& out) {
    out << "Usage: nsid_check [options] [--] <text>...\n"
           "Options:\n"
           "  --kind <nsid|fragment|reference>  What to parse each input as (default reference)\n"
           "  --stdin                           Also read one input per line from stdin\n"
           "  --json                            Print a JSON array describing each input\n"
           "  --indent <n>                      JSON indent (default 2, -1 for compact)\n"
           "  --quiet                           Only report through the exit status\n"
           "  --help                            Show this message\n"
           "Environment:\n"
           "  NSIDREF_LOG=1|<tag,...>           Enable debug logging, optionally for some tags only\n"
           "                                    (debug logging builds only)\n";
}

auto parseCheckOptions(int argc, char const* const* argv, std::ostream& err) -> std::optional<CheckOptions> {
    using CLI::CommandLine;
    CheckOptions options;

    CommandLine cli;
    cli.set_program_name("nsid_check");
    cli.set_error_logger([&err](std::string const& message) { err << message << "\n"; });
    cli.set_positional_handler([&](std::string_view token) {
        options.inputs.emplace_back(token);
        return true;
    });

    CommandLine::ValueOption kindOption{};
    kindOption.on_value = [&](std::string_view value) -> CommandLine::ParseError {
        auto kind = parse_kind(value);
        if (!kind) {
            return "--kind must be one of nsid, fragment, reference (got '" + std::string{value} + "')";
        }
        options.kind = *kind;
        return std::nullopt;
    };
    cli.add_value("--kind", std::move(kindOption));
    cli.add_int("--indent", {.on_value = [&](int value) { options.indent = value; }});

    cli.add_flag("--json", {.on_set = [&] { options.json = true; }});
    cli.add_flag("--quiet", {.on_set = [&] { options.quiet = true; }});
    cli.add_flag("--stdin", {.on_set = [&] { options.readStdin = true; }});
    cli.add_flag("--help", {.on_set = [&] { options.showHelp = true; }});
    cli.add_alias("-h", "--help");
    cli.add_alias("-q", "--quiet");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    return options;
}

auto runCheck(CheckOptions options, std::istream& in, std::ostream& out, std::ostream& err) -> int {
    if (options.showHelp) {
        printCheckUsage(out);
        return kCheckExitValid;
    }

    if (options.readStdin) {
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty())
                options.inputs.push_back(line);
        }
    }

    if (options.inputs.empty()) {
        err << "nsid_check: no input given\n";
        printCheckUsage(err);
        return kCheckExitUsage;
    }

    nr_log("Checking " + std::to_string(options.inputs.size()) + " input(s)", "Tool", "INFO");

    bool           allValid = true;
    nlohmann::json report   = nlohmann::json::array();
    for (auto const& input : options.inputs) {
        auto result = check_input(input, options.kind);
        if (result) {
            nr_log("Accepted '" + input + "'", "Tool", "Input");
            if (options.json) {
                report.push_back(std::move(*result));
            } else if (!options.quiet) {
                out << "ok " << input << '\n';
            }
            continue;
        }

        allValid = false;
        nr_log("Rejected '" + input + "': " + describeError(result.error()), "Tool", "Input");
        if (options.json) {
            report.push_back(describeFailure(input, result.error()));
        } else if (!options.quiet) {
            out << "error " << input << ": " << describeError(result.error()) << '\n';
        }
    }

    // Rejected inputs are echoed as given and need not be UTF-8.
    if (options.json && !options.quiet) {
        out << report.dump(options.indent, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    }

    return allValid ? kCheckExitValid : kCheckExitInvalid;
}

} // namespace NR
