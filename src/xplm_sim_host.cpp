#include "xplm_sim_host.h"

#include "log.h"

#include <cmath>
#include <vector>

namespace panelbridge {

namespace {

constexpr auto kRequestTimeout = std::chrono::seconds(2);
constexpr size_t kMaxQueuedNotifications = 256;
constexpr size_t kMaxQueuedEvents = 256;

const char* kGearDeployRatio = "sim/flightmodel2/gear/deploy_ratio";
const char* kAirspeedIndicated = "sim/cockpit2/gauges/indicators/airspeed_kts_pilot";
const char* kParkingBrakeRatio = "sim/cockpit2/controls/parking_brake_ratio";

bool setDatarefValue(XPLMDataRef ref, int type, float value) {
    if (!ref) {
        return false;
    }
    if (type & xplmType_Float) {
        XPLMSetDataf(ref, value);
        return true;
    }
    if (type & xplmType_Double) {
        XPLMSetDatad(ref, static_cast<double>(value));
        return true;
    }
    if (type & xplmType_Int) {
        XPLMSetDatai(ref, static_cast<int>(std::lround(value)));
        return true;
    }
    return false;
}

}  // namespace

void XplmSimHost::setOnline(bool online, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (online_ == online) {
            return;
        }
        online_ = online;
        if (!online) {
            for (auto& req : requests_) {
                req->ok = false;
                req->err = "simulator offline";
                req->done = true;
            }
            requests_.clear();
            outbound_.clear();
            if (connected_) {
                SimNotification quit;
                quit.kind = SimNotification::Kind::Quit;
                postNotificationLocked(quit);
            }
        }
    }
    cv_.notify_all();
    logLine(std::string("Sim: host ") + (online ? "online" : "offline") + " (" + reason + ")");
}

void XplmSimHost::pump() {
    std::deque<std::shared_ptr<Request>> requests;
    std::deque<OutboundEvent> outbound;
    bool postOpen = false;
    uint64_t session = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!online_ || !connected_) {
            return;
        }
        requests.swap(requests_);
        outbound.swap(outbound_);
        postOpen = openPending_;
        openPending_ = false;
        session = session_;
    }

    if (session != boundSession_) {
        bindings_.clear();
        subscribed_ = false;
        lastSample_.reset();
        boundSession_ = session;
    }

    for (auto& req : requests) {
        handleRequest(*req);
    }
    for (const auto& ev : outbound) {
        executeEvent(ev);
    }

    std::optional<TelemetrySample> sample;
    if (subscribed_) {
        TelemetrySample current = readTelemetry();
        if (!lastSample_ || *lastSample_ != current) {
            lastSample_ = current;
            sample = current;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& req : requests) {
            if (req->ok && req->kind == Request::Kind::MapEvent) {
                mappedEvents_.insert(req->eventId);
            }
            req->done = true;
        }
        if (connected_ && session == session_) {
            if (postOpen) {
                SimNotification open;
                open.kind = SimNotification::Kind::Open;
                postNotificationLocked(open);
            }
            if (sample) {
                SimNotification data;
                data.kind = SimNotification::Kind::Data;
                data.sample = *sample;
                postNotificationLocked(data);
            }
        }
    }
    cv_.notify_all();
}

bool XplmSimHost::connect(const std::string& clientName, std::string& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!online_) {
        err = "X-Plane session not available";
        return false;
    }
    ++session_;
    connected_ = true;
    openPending_ = true;
    clientName_ = clientName;
    requests_.clear();
    outbound_.clear();
    notifications_.clear();
    mappedEvents_.clear();
    return true;
}

void XplmSimHost::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        openPending_ = false;
        for (auto& req : requests_) {
            req->ok = false;
            req->err = "disconnected";
            req->done = true;
        }
        requests_.clear();
        outbound_.clear();
        notifications_.clear();
        mappedEvents_.clear();
    }
    cv_.notify_all();
}

bool XplmSimHost::submitAndWait(const std::shared_ptr<Request>& req, std::string& err) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!online_ || !connected_) {
        err = "simulator offline";
        return false;
    }
    const uint64_t session = session_;
    requests_.push_back(req);
    bool finished = cv_.wait_for(lock, kRequestTimeout, [&] {
        return req->done || !online_ || !connected_ || session_ != session;
    });
    if (!finished) {
        err = "timed out waiting for the simulator";
        return false;
    }
    if (!req->done) {
        err = "simulator offline";
        return false;
    }
    if (!req->ok) {
        err = req->err;
        return false;
    }
    return true;
}

bool XplmSimHost::subscribeAircraftState(std::string& err) {
    auto req = std::make_shared<Request>();
    req->kind = Request::Kind::Subscribe;
    return submitAndWait(req, err);
}

bool XplmSimHost::mapEvent(uint32_t eventId, const std::string& hostEventName, std::string& err) {
    auto req = std::make_shared<Request>();
    req->kind = Request::Kind::MapEvent;
    req->eventId = eventId;
    req->name = hostEventName;
    return submitAndWait(req, err);
}

bool XplmSimHost::transmitEvent(uint32_t eventId, uint32_t data, std::string& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!online_ || !connected_) {
        err = "simulator offline";
        return false;
    }
    if (mappedEvents_.count(eventId) == 0) {
        err = "event " + std::to_string(eventId) + " is not mapped";
        return false;
    }
    if (outbound_.size() >= kMaxQueuedEvents) {
        err = "event queue full";
        return false;
    }
    outbound_.push_back(OutboundEvent{eventId, data});
    return true;
}

PollStatus XplmSimHost::nextNotification(SimNotification& out, std::chrono::milliseconds timeout, std::string& err) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!connected_) {
        err = "not connected";
        return PollStatus::Error;
    }
    cv_.wait_for(lock, timeout, [this] { return !notifications_.empty() || !connected_; });
    if (notifications_.empty()) {
        return PollStatus::None;
    }
    out = notifications_.front();
    notifications_.pop_front();
    return PollStatus::Notification;
}

void XplmSimHost::postNotificationLocked(SimNotification notification) {
    if (notifications_.size() >= kMaxQueuedNotifications) {
        for (auto it = notifications_.begin(); it != notifications_.end(); ++it) {
            if (it->kind == SimNotification::Kind::Data) {
                notifications_.erase(it);
                break;
            }
        }
    }
    notifications_.push_back(std::move(notification));
}

void XplmSimHost::handleRequest(Request& req) {
    if (req.kind == Request::Kind::Subscribe) {
        drGearDeploy_ = XPLMFindDataRef(kGearDeployRatio);
        drAirspeed_ = XPLMFindDataRef(kAirspeedIndicated);
        drParkingBrake_ = XPLMFindDataRef(kParkingBrakeRatio);
        std::vector<std::string> missing;
        if (!drGearDeploy_) missing.push_back(kGearDeployRatio);
        if (!drAirspeed_) missing.push_back(kAirspeedIndicated);
        if (!drParkingBrake_) missing.push_back(kParkingBrakeRatio);
        if (!missing.empty()) {
            req.ok = false;
            req.err = "dataref not found: " + missing.front();
            return;
        }
        subscribed_ = true;
        lastSample_.reset();
        req.ok = true;
        return;
    }

    Binding binding;
    binding.path = req.name;
    binding.cmd = XPLMFindCommand(req.name.c_str());
    if (binding.cmd) {
        binding.type = Binding::Type::Command;
    } else {
        binding.dataref = XPLMFindDataRef(req.name.c_str());
        if (!binding.dataref || !XPLMCanWriteDataRef(binding.dataref)) {
            req.ok = false;
            req.err = "no X-Plane command or writable dataref named " + req.name;
            return;
        }
        binding.type = Binding::Type::Dataref;
        binding.datarefType = XPLMGetDataRefTypes(binding.dataref);
    }
    bindings_[req.eventId] = binding;
    req.ok = true;
}

void XplmSimHost::executeEvent(const OutboundEvent& ev) {
    auto it = bindings_.find(ev.eventId);
    if (it == bindings_.end()) {
        logLine("Sim: dropping unmapped event " + std::to_string(ev.eventId));
        return;
    }
    const Binding& binding = it->second;
    if (binding.type == Binding::Type::Command) {
        XPLMCommandOnce(binding.cmd);
        return;
    }
    if (!setDatarefValue(binding.dataref, binding.datarefType, static_cast<float>(ev.data))) {
        logLine("Sim: cannot write dataref " + binding.path);
    }
}

TelemetrySample XplmSimHost::readTelemetry() const {
    TelemetrySample sample;
    float gear[3] = {0.0f, 0.0f, 0.0f};
    XPLMGetDatavf(drGearDeploy_, gear, 0, 3);
    sample.gearCenterRatio = gear[0];
    sample.gearLeftRatio = gear[1];
    sample.gearRightRatio = gear[2];
    sample.airspeedKts = XPLMGetDataf(drAirspeed_);
    sample.parkingBrakeIndicator = XPLMGetDataf(drParkingBrake_) > 0.0f;
    return sample;
}

}  // namespace panelbridge
