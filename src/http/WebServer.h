#pragma once
#include "../core/DeviceTable.h"
#include "../core/DeviceWriter.h"
#include <microhttpd.h>
#include <chrono>
#include <functional>
#include <string>

namespace sku_scan {

struct HttpReply {
    unsigned int status = MHD_HTTP_OK;
    std::string content_type = "text/plain";
    std::string body;
};

using RestartHook = std::function<void()>;

class WebServer {
public:
    WebServer(const DeviceTable& table, unsigned int port, RestartHook on_restart,
              std::chrono::milliseconds restart_delay = std::chrono::seconds(5));
    ~WebServer();

    WebServer(const WebServer&) = delete;
    WebServer& operator=(const WebServer&) = delete;

    void start();
    void stop();
    bool running() const { return daemon_ != nullptr; }

    // Routing without the network; the microhttpd callback goes through here.
    HttpReply handle(const std::string& method, const std::string& url, const char* accept) const;

private:
    static MHD_Result answer_connection(void* cls, struct MHD_Connection* connection,
                                        const char* url, const char* method,
                                        const char* version, const char* upload_data,
                                        size_t* upload_data_size, void** con_cls);

    const DeviceTable& table_;
    unsigned int port_;
    RestartHook on_restart_;
    std::chrono::milliseconds restart_delay_;
    DeviceWriter writer_;
    struct MHD_Daemon* daemon_;
};

}
