#include "haven/common/Config.h"
#include "haven/common/Logger.h"
#include "haven/gateway/GatewayConfig.h"
#include "haven/gateway/GatewayServer.h"
#include "haven/network/EventLoop.h"

#include <getopt.h>
#include <cstdio>
#include <string>

namespace {

void PrintUsage(const char* prog) {
    std::printf("Usage: %s [-c config_file] [-l level] [-C] [-h]\n"
                "  -c  config file (default ../config/haven.conf)\n"
                "  -l  log level, overrides global.log_level\n"
                "  -C  validate the config and exit\n",
                prog);
}

} // namespace

int main(int argc, char* argv[]) {
    using haven::common::Config;
    using haven::common::Logger;

    std::string configPath = "../config/haven.conf";
    std::string levelOverride;
    bool checkOnly = false;

    int opt;
    while ((opt = ::getopt(argc, argv, "c:l:Ch")) != -1) {
        if (opt == 'c') {
            configPath = optarg;
        } else if (opt == 'l') {
            levelOverride = optarg;
        } else if (opt == 'C') {
            checkOnly = true;
        } else {
            PrintUsage(argv[0]);
            return opt == 'h' ? 0 : 1;
        }
    }

    Config& ini = Config::Instance();
    if (!ini.Load(configPath)) {
        LOG_ERROR << "Cannot start without a config, tried " << configPath;
        return 1;
    }
    const std::string level = levelOverride.empty() ? ini.GetString("global", "log_level", "INFO") : levelOverride;
    Logger::Instance().SetLevel(Logger::ParseLevel(level));

    const haven::gateway::GatewayConfig config = haven::gateway::GatewayConfig::FromConfig(ini);
    const std::string problem = config.Validate();
    if (!problem.empty()) {
        LOG_ERROR << configPath << ": " << problem;
        return 1;
    }
    if (checkOnly) {
        std::printf("OK\n");
        return 0;
    }

    haven::network::EventLoop loop;
    haven::gateway::GatewayServer gateway(&loop, config);
    if (!gateway.Init()) {
        return 1;
    }
    gateway.Start();
    LOG_INFO << "haven-gateway on " << gateway.hostport() << ", " << config.threads << " I/O threads, "
             << Logger::LevelName(Logger::Instance().GetLevel()) << " logging";
    loop.Loop();
    return 0;
}
