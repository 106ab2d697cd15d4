#include "SiteRegistry.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>

namespace GateResolve {

const std::vector<std::string>& SiteRegistry::DefaultDomains() {
    static const std::vector<std::string> kDomains = {
        "gplinks.co", "gplinks.in", "short.st", "ouo.io", "ouo.press",
        "terabox.com", "teraboxapp.com", "1024tera.com", "freeterabox.com",
        "gdtot.pro", "gdtot.dad", "appdrive.me", "drivehub.ws", "driveapp.in",
        "mediafire.com", "droplink.co", "exe.io", "linkvertise.com", "work.ink",
        "shrinkme.io", "bc.vc", "adfly.com", "adf.ly", "bit.ly", "tinyurl.com",
        "cutt.ly", "shorte.st"
    };
    return kDomains;
}

SiteRegistry SiteRegistry::WithDefaults() {
    SiteRegistry registry;
    for (const auto& domain : DefaultDomains()) registry.Register(domain, {});
    return registry;
}

void SiteRegistry::Register(const std::string& domain, const std::vector<std::string>& strategy_ids) {
    std::string key = UrlUtil::StripWww(domain);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key.empty()) return;

    if (strategy_ids.empty()) {
        sites_[key] = std::nullopt;
        return;
    }
    std::set<StrategyKind> allowed;
    for (const auto& id : strategy_ids) {
        if (auto kind = ParseStrategyId(id)) allowed.insert(*kind);
        else Logger::Log(LogLevel::Warn, "Unknown strategy '" + id + "' for site " + key);
    }
    if (allowed.empty()) {
        Logger::Log(LogLevel::Warn, "No valid strategies listed for site " + key + ", allowing all");
        sites_[key] = std::nullopt;
        return;
    }
    sites_[key] = std::move(allowed);
}

const std::optional<std::set<StrategyKind>>* SiteRegistry::Find(const std::string& url) const {
    std::string host = UrlUtil::StripWww(UrlUtil::HostOf(url));
    while (!host.empty()) {
        auto it = sites_.find(host);
        if (it != sites_.end()) return &it->second;
        auto dot = host.find('.');
        if (dot == std::string::npos) break;
        host = host.substr(dot + 1);
    }
    return nullptr;
}

std::optional<std::set<StrategyKind>> SiteRegistry::AllowedFor(const std::string& url) const {
    const auto* entry = Find(url);
    if (!entry) return std::nullopt;
    return *entry;
}

bool SiteRegistry::IsKnown(const std::string& url) const {
    return Find(url) != nullptr;
}

}
