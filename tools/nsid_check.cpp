#include "tools/NsidCheck.hpp"
#include "utils/LogSetting.hpp"
#include "utils/TaggedLogger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

int main(int argc, char** argv) {
#ifdef NR_LOG_DEBUG
    NR::set_thread_name("nsid_check");
    NR::configure_logging(NR::parse_log_setting(std::getenv("NSIDREF_LOG")));
#endif

    auto options = NR::parseCheckOptions(argc, argv, std::cerr);
    if (!options) {
        return NR::kCheckExitUsage;
    }
    return NR::runCheck(std::move(*options), std::cin, std::cout, std::cerr);
}
