#include "core/ArgumentParser.h"
#include "core/Classifier.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/DeviceTable.h"
#include "core/Logging.h"
#include "core/Reconciler.h"
#include "core/Subprocess.h"
#include "net/ArpScanSource.h"
#include "net/HostCommandResolver.h"
#include "net/SshRemoteProbe.h"
#include "http/WebServer.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <atomic>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <pthread.h>
#include <signal.h>
#include <iostream>
#include <stdexcept>

using namespace sku_scan;

namespace {
std::atomic<bool> restart_requested{false};
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    load_env_config(cfg);
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;
    set_config(cfg);
    const Config& conf = config();

    if(conf.debug){
        Logger::instance().set_level(LogLevel::Debug);
        Logger::instance().info("DEBUG mode is on");
    }
    Logger::instance().info(std::string("sku-scan ") + buildinfo::APP_VERSION + " (git=" + buildinfo::GIT_COMMIT + ") started");

    // Signals are taken synchronously below; block them before any thread exists
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    signal(SIGPIPE, SIG_IGN);

    SubprocessRunner runner;
    ArpScanSource source(conf, runner);
    SshRemoteProbe probe(conf, runner);
    HostCommandResolver resolver(conf, runner, probe);
    DeviceTable table;
    Classifier classifier(table, resolver, probe);
    Reconciler reconciler(conf, table, source, classifier);

    WebServer web_server(table, static_cast<unsigned int>(conf.port), []{ restart_requested = true; }, conf.restart_delay);
    try {
        web_server.start();
    } catch(const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    reconciler.start();

    int exit_code = 0;
    bool restart_pending = false;
    auto restart_at = std::chrono::steady_clock::now();
    while(true){
        struct timespec tick{1, 0};
        int sig = sigtimedwait(&sigs, nullptr, &tick);
        if(sig == SIGINT || sig == SIGTERM){
            Logger::instance().info(std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");
            break;
        }
        if(sig < 0 && errno != EAGAIN && errno != EINTR){
            Logger::instance().error("sigtimedwait failed");
            exit_code = 1;
            break;
        }
        if(restart_requested && !restart_pending){
            restart_pending = true;
            restart_at = std::chrono::steady_clock::now() + conf.restart_delay;
        }
        if(restart_pending && std::chrono::steady_clock::now() >= restart_at){
            Logger::instance().info("Exiting for restart");
            exit_code = 2;
            break;
        }
    }

    web_server.stop();
    reconciler.stop();
    return exit_code;
}
