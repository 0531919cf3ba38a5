#include "tools/NsidJson.hpp"

#include <string>

namespace NR {

namespace {

using Json = nlohmann::json;

auto segmentsArray(Nsid const& nsid) -> Json {
    Json segments = Json::array();
    for (auto segment : nsid.segments()) {
        segments.push_back(std::string{segment});
    }
    return segments;
}

auto fillNsidFields(Json& out, Nsid const& nsid) -> void {
    out["nsid"]      = std::string{nsid.asStr()};
    out["authority"] = std::string{nsid.authority()};
    out["name"]      = std::string{nsid.name()};
    out["segments"]  = segmentsArray(nsid);
}

} // namespace

auto describeNsid(Nsid const& nsid) -> nlohmann::json {
    Json out;
    out["input"] = std::string{nsid.asStr()};
    out["valid"] = true;
    out["kind"]  = "nsid";
    fillNsidFields(out, nsid);
    return out;
}

auto describeFragment(Fragment const& fragment) -> nlohmann::json {
    Json out;
    out["input"]        = std::string{fragment.asStr()};
    out["valid"]        = true;
    out["kind"]         = "fragment";
    out["fragment"]     = std::string{fragment.asStr()};
    out["fragmentName"] = std::string{fragment.name()};
    return out;
}

auto describeReference(Reference const& reference) -> nlohmann::json {
    if (auto const* relative = reference.relative()) {
        auto out    = describeFragment(*relative);
        out["kind"] = "relative";
        return out;
    }

    auto const& full = *reference.full();
    Json        out;
    out["input"] = std::string{full.asStr()};
    out["valid"] = true;
    out["kind"]  = "full";
    fillNsidFields(out, full.cloneNsid());
    if (auto fragment = full.cloneFragment()) {
        out["fragment"]     = std::string{fragment->asStr()};
        out["fragmentName"] = std::string{fragment->name()};
    } else {
        out["fragment"]     = nullptr;
        out["fragmentName"] = nullptr;
    }
    return out;
}

auto describeFailure(std::string_view input, Error const& error) -> nlohmann::json {
    Json out;
    out["input"]   = std::string{input};
    out["valid"]   = false;
    out["error"]   = std::string{errorCodeToString(error.code)};
    out["message"] = error.message.value_or("");
    return out;
}

} // namespace NR
