#include "core/ArgumentParser.h"
#include "core/CollectorRegistry.h"
#include "core/Config.h"
#include "core/Logging.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using namespace port_census;

static int write_output(const Config& cfg, const nlohmann::json& doc){
    int indent = cfg.pretty ? 2 : -1;
    std::string out = doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    if(cfg.output_file.empty()){ std::cout << out << "\n"; return 0; }
    std::ofstream ofs(cfg.output_file);
    if(!ofs){ std::cerr << "Failed to open output file: " << cfg.output_file << "\n"; return 1; }
    ofs << out << "\n";
    if(!ofs){ std::cerr << "Failed to write output file: " << cfg.output_file << "\n"; return 1; }
    return 0;
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    load_env(cfg);
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    if(!ConfigValidator::validate(cfg)) return 2;
    if(!cfg.log_level.empty()){
        LogLevel lvl;
        if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);
    }
    set_config(cfg);

    CollectorRegistry registry(cfg);
    registry.register_all_default();

    if(cfg.detect_only){
        registry.detect_collector();
        return write_output(cfg, registry.last_detection());
    }

    CollectorPtr collector = cfg.platform.empty() ? registry.detect_collector() : registry.create_collector(cfg.platform);
    Logger::instance().info("Collecting with " + collector->platform_name() + " collector");
    CollectionResult result = collector->collect_all();

    nlohmann::json doc = result;
    if(!collector->detection_info().empty()) doc["detection"] = collector->detection_info();
    return write_output(cfg, doc);
}
