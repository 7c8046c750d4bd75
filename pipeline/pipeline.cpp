#include "pipeline/pipeline.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <initializer_list>

Pipeline::Pipeline(const AppConfig& config, const ActionRegistry& registry, PipelineDeps deps)
    : config_(config), registry_(registry), deps_(std::move(deps)) {
    if (!deps_.utterances || !deps_.recognition || !deps_.bridge || !deps_.feedback) {
        throw FatalError("ERR_PIPELINE_INCOMPLETE", "Pipeline created without required collaborators");
    }
    if (deps_.wakeBackend && !deps_.frames) {
        throw FatalError("ERR_PIPELINE_INCOMPLETE", "Wake backend given without a frame source");
    }
}

Pipeline::~Pipeline() {
    stop();
}

std::vector<Stage*> Pipeline::stagesInStartOrder() const {
    std::vector<Stage*> stages;
    for (Stage* s : std::initializer_list<Stage*>{ dispatcher_.get(), timers_.get(), recognizer_.get(),
                                                  capture_.get(), wake_.get() }) {
        if (s) stages.push_back(s);
    }
    return stages;
}

void Pipeline::start() {
    if (running_) return;

    LOG_DEBUG("Pipeline", std::string("Starting in ") + (continuous() ? "continuous" : "wake word") + " mode");

    errors_        = std::make_unique<ErrorChannel>(kChannelCapacity * 4);
    captureEvents_ = std::make_unique<EventChannel>(kChannelCapacity);
    audio_         = std::make_unique<EventChannel>(kChannelCapacity);
    commands_      = std::make_unique<EventChannel>(kChannelCapacity);

    timers_ = std::make_unique<TimerService>(*commands_, *errors_);

    dispatcher_ = std::make_unique<Dispatcher>(config_, registry_, *deps_.bridge, *timers_,
                                               *deps_.feedback, *commands_, captureEvents_.get(),
                                               *errors_);

    recognizer_ = std::make_unique<Recognizer>(config_.recognition, deps_.recognition,
                                               *deps_.feedback, *audio_, *commands_, *errors_);

    capture_ = std::make_unique<AudioCapture>(config_.capture,
                                              continuous() ? AudioCapture::Mode::Continuous
                                                           : AudioCapture::Mode::Gated,
                                              *deps_.utterances, *captureEvents_, *audio_, *errors_);

    if (!continuous()) {
        wake_ = std::make_unique<WakeDetector>(*deps_.wakeBackend, *deps_.frames, *deps_.feedback,
                                               *captureEvents_, *errors_);
    }

    try {
        for (Stage* s : stagesInStartOrder()) {
            s->start();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Pipeline", std::string("Failed to start stages: ") + e.what());
        stop();
        throw;
    }

    running_ = true;
    LOG_PHASE("Pipeline started", true);
}

void Pipeline::stop() {
    if (!running_ && !dispatcher_) return;

    if (captureEvents_) captureEvents_->close();
    if (audio_) audio_->close();

    auto stages = stagesInStartOrder();
    for (auto it = stages.rbegin(); it != stages.rend(); ++it) {
        (*it)->stop();
    }
    if (timers_) timers_->cancelAll();

    wake_.reset();
    capture_.reset();
    recognizer_.reset();
    dispatcher_.reset();
    timers_.reset();

    commands_.reset();
    audio_.reset();
    captureEvents_.reset();
    errors_.reset();

    running_ = false;
    LOG_PHASE("Pipeline stopped", true);
}

std::vector<Stage::Status> Pipeline::health() const {
    std::vector<Stage::Status> out;
    for (Stage* s : stagesInStartOrder()) {
        out.push_back(s->status());
    }
    return out;
}

std::vector<PipelineError> Pipeline::drainErrors() {
    std::vector<PipelineError> out;
    if (!errors_) return out;
    while (auto err = errors_->tryPop()) {
        out.push_back(std::move(*err));
    }
    return out;
}
