#pragma once

#include "core/Error.hpp"
#include "nsid/Fragment.hpp"
#include "nsid/Nsid.hpp"
#include "nsid/Reference.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace NR {

auto describeNsid(Nsid const& nsid) -> nlohmann::json;
auto describeFragment(Fragment const& fragment) -> nlohmann::json;
auto describeReference(Reference const& reference) -> nlohmann::json;
auto describeFailure(std::string_view input, Error const& error) -> nlohmann::json;

} // namespace NR
