#pragma once
#include "bridge/RequestMailbox.hpp"
#include "facade/RequestFacade.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib { class Server; }

// HTTP surface for the `user` tool. Each request runs on an httplib worker
// thread, which is the producer side of the mailbox.
//
//   GET  /health      mailbox snapshot
//   GET  /tools       tool listing (name, description, single-input schema)
//   POST /tools/user  tool call, answered with the MCP content envelope
class ToolServer {
public:
    ToolServer(RequestFacade& facade, RequestMailbox& mailbox,
               std::string renderHostName);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    // Binds and starts the listener thread. False if the port is taken.
    bool start(const std::string& host, int port);
    void stop();
    bool isRunning() const { return running_; }
    int  port() const { return boundPort_; }

    // Route bodies, usable without a socket
    nlohmann::json health() const;
    static nlohmann::json toolListing();
    nlohmann::json callTool(const std::string& body, int& status);

private:
    void registerRoutes();

    RequestFacade&  facade_;
    RequestMailbox& mailbox_;
    std::string     renderHostName_;

    std::unique_ptr<httplib::Server> server_;
    std::thread       listenThread_;
    std::atomic<bool> running_{false};
    int               boundPort_ = 0;
};
