#pragma once
#include "bridge/RequestMailbox.hpp"
#include "config/BridgeConfig.hpp"
#include "dispatch/DispatchLoop.hpp"
#include "facade/RequestFacade.hpp"
#include "render/IRenderHost.hpp"
#include "server/ToolServer.hpp"
#include "settings/ISettingsStore.hpp"
#include <atomic>
#include <memory>

// Owns and wires the bridge: mailbox, render host, dispatch loop, facade
// and HTTP server. The thread that calls run() becomes the UI thread.
class BridgeService {
public:
    BridgeService(const BridgeConfig& config,
                  std::unique_ptr<IRenderHost> host,
                  ISettingsStore& settings);
    ~BridgeService();

    // Start the render host and the HTTP listener
    bool start();

    // Serve UI requests on the calling thread until stop()
    void run();

    // Thread-safe
    void stop();

    // Signal-handler safe
    void requestStop() noexcept { loop_.requestStop(); }

    bool isRunning() const { return running_; }

    RequestFacade&  facade()  { return facade_; }
    RequestMailbox& mailbox() { return mailbox_; }

    static ToolIdentity identityFor(ISettingsStore& settings,
                                    const std::string& toolVersion);

private:
    BridgeConfig                 config_;
    std::unique_ptr<IRenderHost> host_;
    RequestMailbox               mailbox_;
    DispatchLoop                 loop_;
    RequestFacade                facade_;
    ToolServer                   server_;
    std::atomic<bool>            running_{false};
};
