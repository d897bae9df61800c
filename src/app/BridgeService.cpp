#include "app/BridgeService.hpp"
#include "facade/ToolSchema.hpp"
#include <spdlog/spdlog.h>
#include <pwd.h>
#include <unistd.h>
#include <algorithm>

// The terminal has to be pumped for keystrokes even with nothing open
static DispatchConfig dispatchFor(const BridgeConfig& c) {
    DispatchConfig d = c.dispatch;
    if (!c.headless())
        d.idleWait = std::min(d.idleWait, d.pumpInterval);
    return d;
}

BridgeService::BridgeService(const BridgeConfig& config,
                             std::unique_ptr<IRenderHost> host,
                             ISettingsStore& settings)
    : config_(config)
    , host_(std::move(host))
    , loop_(mailbox_, *host_, dispatchFor(config))
    , facade_(mailbox_, identityFor(settings, config.toolVersion), &settings,
              config.facade)
    , server_(facade_, mailbox_, host_->backendName())
{
}

BridgeService::~BridgeService() {
    stop();
    server_.stop();
}

ToolIdentity BridgeService::identityFor(ISettingsStore& settings,
                                        const std::string& toolVersion) {
    ToolIdentity id;
    id.fileIdentity = settings.installationId() + ":" + ToolSchema::toolName;

    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_name)
        id.userIdentity = pw->pw_name;
    else
        id.userIdentity = getEnv("USER", "unknown");

    id.versionIdentity = toolVersion;
    return id;
}

bool BridgeService::start() {
    if (!host_->start()) {
        spdlog::error("Render host '{}' failed to start", host_->backendName());
        return false;
    }

    if (!server_.start(config_.serverHost, config_.serverPort)) {
        host_->stop();
        return false;
    }

    running_ = true;
    spdlog::info("Bridge running — render host '{}', unlock token {}",
                 host_->backendName(), facade_.token());
    return true;
}

void BridgeService::run() {
    if (!running_) return;

    loop_.run();

    // Loop has answered everything; nothing new can be accepted
    server_.stop();
    host_->stop();
    running_ = false;
    spdlog::info("Bridge stopped ({} requests)", facade_.requestsIssued());
}

void BridgeService::stop() {
    loop_.stop();
}
