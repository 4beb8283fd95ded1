#include "WebServer.h"
#include "../core/Logging.h"
#include <stdexcept>

namespace sku_scan {

WebServer::WebServer(const DeviceTable& table, unsigned int port, RestartHook on_restart,
                     std::chrono::milliseconds restart_delay)
    : table_(table), port_(port), on_restart_(std::move(on_restart)), restart_delay_(restart_delay), daemon_(nullptr) {}

WebServer::~WebServer(){
    stop();
}

HttpReply WebServer::handle(const std::string& method, const std::string& url, const char* accept) const {
    auto& log = Logger::instance();
    HttpReply reply;
    if(method != MHD_HTTP_METHOD_GET){
        reply.status = MHD_HTTP_METHOD_NOT_ALLOWED;
        reply.body = "Method not allowed";
        return reply;
    }
    if(url == "/devices"){
        std::string accept_str = accept ? accept : "";
        log.debug("Accept: " + accept_str);
        auto devices = table_.values();
        if(DeviceWriter::wants_json(accept_str)){
            reply.content_type = "application/json";
            reply.body = writer_.write_json(devices);
        } else {
            reply.body = writer_.write_text(devices);
        }
        return reply;
    }
    if(url == "/pm2-restart" || url == "/restart"){
        log.info("Restart requested over HTTP");
        if(on_restart_) on_restart_();
        reply.body = "Restart in " + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(restart_delay_).count()) + " seconds";
        return reply;
    }
    reply.status = MHD_HTTP_NOT_FOUND;
    reply.body = "Not found";
    return reply;
}

MHD_Result WebServer::answer_connection(void* cls, struct MHD_Connection* connection,
                                        const char* url, const char* method,
                                        const char* version, const char* upload_data,
                                        size_t* upload_data_size, void** con_cls)
{
    (void) version;           /* Unused. Silent compiler warning. */
    (void) upload_data;       /* Unused. Silent compiler warning. */
    (void) upload_data_size;  /* Unused. Silent compiler warning. */
    (void) con_cls;           /* Unused. Silent compiler warning. */
    const WebServer* self = static_cast<const WebServer*>(cls);

    const char* accept = MHD_lookup_connection_value(connection, MHD_HEADER_KIND, MHD_HTTP_HEADER_ACCEPT);
    HttpReply reply;
    try {
        reply = self->handle(method ? method : "", url ? url : "", accept);
    } catch(const std::exception& ex) {
        Logger::instance().error(std::string("Request failed: ") + ex.what());
        reply.status = MHD_HTTP_INTERNAL_SERVER_ERROR;
        reply.content_type = "text/plain";
        reply.body = "Internal error";
    }

    struct MHD_Response* response = MHD_create_response_from_buffer(reply.body.size(),
                                                                    const_cast<char*>(reply.body.data()),
                                                                    MHD_RESPMEM_MUST_COPY);
    if(!response) return MHD_NO;
    MHD_add_response_header(response, MHD_HTTP_HEADER_CONTENT_TYPE, reply.content_type.c_str());
    MHD_Result ret = MHD_queue_response(connection, reply.status, response);
    MHD_destroy_response(response);
    return ret;
}

void WebServer::start(){
    if(daemon_){
        Logger::instance().warn("Attempted to start already running web server");
        return;
    }

    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                               static_cast<uint16_t>(port_), nullptr, nullptr,
                               &WebServer::answer_connection, this, MHD_OPTION_END);
    if(!daemon_){
        Logger::instance().error("Failed to start web server on port " + std::to_string(port_));
        throw std::runtime_error("Failed to start web server");
    }
    Logger::instance().info("Web server started. Listening on port " + std::to_string(port_));
}

void WebServer::stop(){
    if(!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
    Logger::instance().info("Web server stopped");
}

}
