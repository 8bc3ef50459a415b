#include "bridge.h"

#include "log.h"

namespace panelbridge {

Bridge::Bridge(Prefs prefs, SimHost& host, TransportFactory factory)
    : prefs_(std::move(prefs)), host_(host), factory_(std::move(factory)) {}

Bridge::~Bridge() {
    stop();
}

void Bridge::start() {
    if (running_) {
        return;
    }
    router_ = std::make_unique<EventRouter>();
    simLink_ = std::make_unique<SimLink>(simLinkConfigFromPrefs(prefs_), host_, router_->takeSimEndpoints());
    simThread_ = std::thread([link = simLink_.get()] { link->run(); });

    for (const auto& panel : prefs_.panels) {
        if (!panel.enabled) {
            continue;
        }
        if (panel.port.empty()) {
            logLine("Panel '" + panel.name + "' has no port configured, skipping");
            continue;
        }
        auto worker = std::make_unique<PanelWorker>();
        worker->prefs = panel;
        launchPanel(*worker);
        panels_.push_back(std::move(worker));
    }
    running_ = true;
    logLine("Bridge started with " + std::to_string(panels_.size()) + " panel(s)");
}

void Bridge::stop() {
    if (!running_) {
        return;
    }
    for (auto& worker : panels_) {
        if (worker->link) {
            worker->link->requestStop();
        }
    }
    if (simLink_) {
        simLink_->requestStop();
    }
    for (auto& worker : panels_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    if (simThread_.joinable()) {
        simThread_.join();
    }
    panels_.clear();
    simLink_.reset();
    router_.reset();
    running_ = false;
    logLine("Bridge stopped");
}

void Bridge::launchPanel(PanelWorker& worker) {
    PanelLinkConfig cfg = panelLinkConfigFromPrefs(worker.prefs);
    std::unique_ptr<SerialTransport> transport = factory_(cfg);
    worker.link = std::make_unique<PanelLink>(cfg, std::move(transport), router_->attachPanel(cfg.name));
    worker.result.reset();
    worker.finished.store(false);
    worker.restartPending = false;
    ++worker.starts;
    PanelWorker* w = &worker;
    worker.thread = std::thread([w] {
        w->result = w->link->run();
        w->finished.store(true);
    });
}

void Bridge::reapPanel(PanelWorker& worker) {
    if (worker.thread.joinable()) {
        worker.thread.join();
    }
    worker.link.reset();
    if (worker.result) {
        logLine("Panel '" + worker.prefs.name + "' stopped: " + worker.result->describe());
        worker.lastError = worker.result;
    } else {
        logLine("Panel '" + worker.prefs.name + "' stopped");
    }
    if (worker.prefs.restart) {
        worker.restartPending = true;
        worker.restartDue = std::chrono::steady_clock::now() + std::chrono::seconds(worker.prefs.restartSec);
        logLine("Panel '" + worker.prefs.name + "' restart in " + std::to_string(worker.prefs.restartSec) + "s");
    }
}

void Bridge::supervise() {
    if (!running_) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    for (auto& worker : panels_) {
        if (worker->link && worker->finished.load()) {
            reapPanel(*worker);
        }
        if (!worker->link && worker->restartPending && now >= worker->restartDue) {
            logLine("Panel '" + worker->prefs.name + "' restarting");
            launchPanel(*worker);
        }
    }
}

std::vector<PanelStatus> Bridge::panelStatus() const {
    std::vector<PanelStatus> out;
    for (const auto& worker : panels_) {
        PanelStatus status;
        status.name = worker->prefs.name;
        status.running = worker->link != nullptr && !worker->finished.load();
        status.state = worker->link ? worker->link->state() : PanelLinkState::Disconnected;
        status.restartPending = worker->restartPending;
        status.starts = worker->starts;
        status.lastError = worker->lastError;
        out.push_back(status);
    }
    return out;
}

}  // namespace panelbridge
