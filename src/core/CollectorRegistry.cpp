#include "CollectorRegistry.h"
#include "Logging.h"
#include "../collectors/DockerCollector.h"
#include "../collectors/SystemCollector.h"
#include "../collectors/TrueNASCollector.h"

namespace port_census {

using nlohmann::json;

CollectorRegistry::CollectorRegistry(Config cfg, CommandRunnerPtr runner) : cfg_(std::move(cfg)), runner_(std::move(runner)) {
    if(!runner_) runner_ = std::make_shared<ShellCommandRunner>();
}

const std::vector<std::string>& CollectorRegistry::detection_order(){
    static const std::vector<std::string> order = {"truenas", "docker", "system"};
    return order;
}

void CollectorRegistry::register_collector(const std::string& platform, CollectorFactory factory){
    factories_[platform] = std::move(factory);
}

void CollectorRegistry::register_all_default(){
    register_collector("base", [](const Config& c, CommandRunnerPtr r) -> CollectorPtr { return std::make_unique<BaseCollector>(c, std::move(r)); });
    register_collector("truenas", [](const Config& c, CommandRunnerPtr r) -> CollectorPtr { return std::make_unique<TrueNASCollector>(c, std::move(r)); });
    register_collector("docker", [](const Config& c, CommandRunnerPtr r) -> CollectorPtr { return std::make_unique<DockerCollector>(c, std::move(r)); });
    register_collector("system", [](const Config& c, CommandRunnerPtr r) -> CollectorPtr { return std::make_unique<SystemCollector>(c, std::move(r)); });
}

CollectorPtr CollectorRegistry::create_collector(const std::string& platform) const {
    auto it = factories_.find(platform);
    if(it == factories_.end()){
        Logger::instance().debug("No collector registered for '" + platform + "', using base collector");
        it = factories_.find("base");
        if(it == factories_.end()) return std::make_unique<BaseCollector>(cfg_, runner_);
    }
    return it->second(cfg_, runner_);
}

CollectorPtr CollectorRegistry::detect_collector(){
    CollectorPtr best;
    int best_score = -1;
    json scores = json::object();
    for(const auto& type : detection_order()){
        if(!has_collector(type)) continue;
        CollectorPtr candidate = create_collector(type);
        int score = 0;
        try {
            score = candidate->is_compatible();
        } catch(const std::exception& ex){
            Logger::instance().warn("[Collector] Error checking compatibility for " + type + ": " + ex.what());
            score = 0;
        }
        scores[type] = score;
        Logger::instance().debug("[Collector] Compatibility score for " + type + ": " + std::to_string(score));
        if(score > best_score){
            best_score = score;
            best = std::move(candidate);
        }
    }

    last_detection_ = json::object();
    last_detection_["scores"] = scores;
    if(!best || best_score <= 0){
        Logger::instance().info("[Collector] No compatible collector detected with score > 0, using system collector");
        best = has_collector("system") ? create_collector("system") : CollectorPtr(std::make_unique<SystemCollector>(cfg_, runner_));
        best_score = 0;
    } else {
        Logger::instance().info("[Collector] Auto-detected " + best->platform() + " collector with score " + std::to_string(best_score));
    }
    last_detection_["platform"] = best->platform();
    last_detection_["score"] = best_score;
    last_detection_["reasons"] = best->detection_reasons();
    best->set_detection_info(last_detection_);
    return best;
}

}
