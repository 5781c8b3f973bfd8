#include "HarmonicsEngine.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "../engine/core/Logger.h"
#include "ConfigLoader.h"
#include "EntityFactories.h"

namespace Zen {

namespace {
constexpr int kMaxFlushPasses = 8;
constexpr unsigned long long kFpsSampleInterval = 10;

nlohmann::json toJson(const Engine::Vec2& v) { return {{"x", v.x}, {"y", v.y}}; }

nlohmann::json toJson(const EnergyBalance& b) {
    return {{"calm", b.calm}, {"vibrant", b.vibrant}, {"intense", b.intense}};
}
}  // namespace

HarmonicsEngine::HarmonicsEngine(GameConfig config)
    : config_(std::move(config)),
      rng_(config_.seed),
      dissonanceSys_(rng_),
      amplifierSys_(rng_),
      field_(config_.seed ^ 0x9e3779b9u) {
    harmonic_.setEventSink([this](GameEventType type, nlohmann::json data) { emit(type, std::move(data)); });
    core_ = makeCore(ids_, config_);
    field_.configure(config_.visual, config_.field.width, config_.field.height);
}

bool HarmonicsEngine::initialize() {
    if (machine_.state() != GameState::Loading) {
        Engine::logInfo("Engine already initialized.");
        return false;
    }
    harmonic_.initialize(config_, ids_);
    machine_.finishLoading();
    Engine::logInfo("Harmonics engine ready (" + std::to_string(harmonic_.resonators().size()) + " resonators).");
    flushEvents();
    return true;
}

bool HarmonicsEngine::start() { return start(config_); }

bool HarmonicsEngine::start(const GameConfig& config) {
    const GameConfig copy = config;
    if (deferIfDispatching("start", [this, copy]() { startWith(copy); })) return false;
    const bool ok = startWith(copy);
    flushEvents();
    return ok;
}

bool HarmonicsEngine::start(const nlohmann::json& overrides) {
    return start(ConfigLoader::applyOverrides(config_, overrides));
}

bool HarmonicsEngine::startWith(const GameConfig& config) {
    if (machine_.state() == GameState::Loading) {
        initialize();
    }
    if (!machine_.start()) {
        return false;
    }
    config_ = config;
    beginSession();
    emit(GameEventType::GameStarted, {{"mode", std::string(toString(config_.mode))},
                                      {"difficulty", std::string(toString(config_.difficulty))},
                                      {"seed", config_.seed}});
    startDriver();
    Engine::logInfo("Session started: mode " + std::string(toString(config_.mode)) + ", difficulty " +
                    std::string(toString(config_.difficulty)) + ", seed " + std::to_string(config_.seed) + ".");
    return true;
}

void HarmonicsEngine::clearSession() {
    core_ = makeCore(ids_, config_);
    dissonances_.clear();
    amplifiers_.clear();
    effects_.clear();
    harmonic_.initialize(config_, ids_);
    collision_.reset();
    dissonanceSys_.resetTimer();
    amplifierSys_.resetTimer();
    score_ = 0.0f;
    depletionHandled_ = false;
}

void HarmonicsEngine::beginSession() {
    rng_.seed(config_.seed);
    clearSession();
    field_.configure(config_.visual, config_.field.width, config_.field.height);
}

bool HarmonicsEngine::pause() {
    if (deferIfDispatching("pause", [this]() { pause(); })) return false;
    if (!machine_.pause()) return false;
    stopDriver();
    emit(GameEventType::GamePaused, {{"score", score_}});
    flushEvents();
    return true;
}

bool HarmonicsEngine::resume() {
    if (deferIfDispatching("resume", [this]() { resume(); })) return false;
    if (!machine_.resume()) return false;
    startDriver();
    emit(GameEventType::GameResumed);
    flushEvents();
    return true;
}

bool HarmonicsEngine::togglePause() {
    if (machine_.state() == GameState::Paused) return resume();
    return pause();
}

bool HarmonicsEngine::end() {
    if (deferIfDispatching("end", [this]() { end(); })) return false;
    const bool ok = finishSession(false, "ended");
    flushEvents();
    return ok;
}

bool HarmonicsEngine::finishSession(bool victory, const char* reason) {
    if (!machine_.end(victory)) return false;
    stopDriver();
    emit(GameEventType::GameEnded, {{"score", score_},
                                    {"patterns", harmonic_.patternsCompleted()},
                                    {"harmonyLevel", core_.harmonyLevel},
                                    {"victory", victory},
                                    {"reason", reason}});
    Engine::logInfo(std::string(victory ? "Victory" : "Game over") + " (" + reason + "), score " +
                    std::to_string(static_cast<int>(score_)) + ".");
    return true;
}

bool HarmonicsEngine::reset() {
    if (deferIfDispatching("reset", [this]() { reset(); })) return false;
    stopDriver();
    machine_.reset();
    clearSession();
    flushEvents();
    return true;
}

void HarmonicsEngine::tick(double deltaSeconds) {
    if (inTick_ || bus_.dispatching()) {
        Engine::logWarn("Re-entrant tick ignored.");
        return;
    }
    if (!(deltaSeconds >= 0.0)) {
        Engine::logWarn("Tick with invalid delta ignored.");
        return;
    }
    inTick_ = true;
    const float dt = static_cast<float>(deltaSeconds);
    clock_ += deltaSeconds;
    ++tickCount_;
    if (tickCount_ % kFpsSampleInterval == 0 && deltaSeconds > 0.0) {
        fps_ = static_cast<int>(std::lround(1.0 / deltaSeconds));
    }

    runDeferred();
    if (machine_.isPlaying()) {
        stepPlaying(dt);
    }
    inTick_ = false;
    flushEvents();
}

void HarmonicsEngine::stepPlaying(float dt) {
    float before = core_.energy;
    coreSim_.update(core_, config_, dt);
    checkDepletion(before);
    if (!machine_.isPlaying()) return;

    dissonanceSys_.update(dissonances_, core_, config_, ids_, dt);
    amplifierSys_.update(amplifiers_, config_, ids_, dt);
    amplifierSys_.updateEffects(core_, effects_, dt);

    score_ += harmonic_.update(core_, config_, ids_, dt);
    if (core_.harmonyLevel >= config_.harmony.victoryHarmonyLevel) {
        finishSession(true, "harmony");
        return;
    }

    before = core_.energy;
    collision_.update(
        core_, dissonances_, amplifiers_, config_, dt, [this](const Dissonance& d) { onDissonanceHit(d); },
        [this](const Amplifier& a) { onAmplifierCollected(a); });
    dissonances_.erase(std::remove_if(dissonances_.begin(), dissonances_.end(),
                                      [](const Dissonance& d) { return !d.isActive; }),
                       dissonances_.end());
    amplifiers_.erase(std::remove_if(amplifiers_.begin(), amplifiers_.end(),
                                     [](const Amplifier& a) { return !a.isActive; }),
                      amplifiers_.end());
    checkDepletion(before);
    if (!machine_.isPlaying()) return;

    score_ += CollisionSystem::scoreFor(core_, dt);
}

void HarmonicsEngine::onDissonanceHit(const Dissonance& d) {
    core_.brightness = CoreSimulation::brightnessFor(core_);
    emit(GameEventType::CoreCollision, {{"dissonanceId", d.id},
                                        {"position", toJson(d.position)},
                                        {"disruptionLevel", d.disruptionLevel},
                                        {"type", std::string(toString(d.type))},
                                        {"energy", core_.energy}});
}

void HarmonicsEngine::onAmplifierCollected(const Amplifier& a) {
    const EffectOutcome outcome = amplifierSys_.applyEffect(a, core_, effects_, config_);
    score_ += outcome.scoreDelta;
    core_.brightness = CoreSimulation::brightnessFor(core_);
    emit(GameEventType::PowerupCollected, {{"amplifierId", a.id},
                                           {"position", toJson(a.position)},
                                           {"type", std::string(toString(a.type))},
                                           {"value", a.value}});
    if (outcome.balanced) {
        emit(GameEventType::EnergyBalanced,
             {{"oldBalance", toJson(outcome.oldBalance)}, {"newBalance", toJson(outcome.newBalance)}});
    }
}

void HarmonicsEngine::checkDepletion(float energyBefore) {
    if (depletionHandled_ || !(energyBefore > 0.0f) || core_.energy > 0.0f) return;
    depletionHandled_ = true;
    emit(GameEventType::EnergyDepleted, {{"score", score_}});
    finishSession(false, "energy depleted");
}

void HarmonicsEngine::updateField(double deltaSeconds) {
    if (deltaSeconds > 0.0) {
        field_.update(static_cast<float>(deltaSeconds));
    }
}

bool HarmonicsEngine::applyImpulse(const Engine::Vec2& direction) {
    if (deferIfDispatching("applyImpulse", [this, direction]() { applyImpulse(direction); })) return false;
    if (!machine_.isPlaying()) {
        Engine::logDebug("applyImpulse ignored outside PLAYING.");
        return false;
    }
    const float before = core_.energy;
    if (!coreSim_.applyImpulse(core_, direction, config_)) {
        return false;
    }
    field_.registerInteraction();
    checkDepletion(before);
    flushEvents();
    return true;
}

bool HarmonicsEngine::generateWave(EnergyType type) {
    if (deferIfDispatching("generateWave", [this, type]() { generateWave(type); })) return false;
    if (!machine_.isPlaying()) {
        Engine::logDebug("generateWave ignored outside PLAYING.");
        return false;
    }
    if (core_.energy < config_.energy.waveCost) {
        Engine::logDebug("generateWave ignored: not enough energy.");
        return false;
    }
    if (!harmonic_.generateWave(core_, type, config_, ids_)) {
        Engine::logDebug("generateWave ignored: wave cap reached.");
        return false;
    }
    const float before = core_.energy;
    core_.energy -= config_.energy.waveCost;
    CoreSimulation::clampEnergy(core_);
    core_.energyBalance[type] += config_.energy.waveBalanceShift;
    core_.brightness = CoreSimulation::brightnessFor(core_);
    field_.registerInteraction();
    checkDepletion(before);
    flushEvents();
    return true;
}

std::optional<Engine::EntityId> HarmonicsEngine::addResonator(const Engine::Vec2& position, EnergyType type) {
    if (deferIfDispatching("addResonator", [this, position, type]() { addResonator(position, type); })) {
        return std::nullopt;
    }
    if (const Resonator* r = harmonic_.addResonator(position, type, config_, ids_)) {
        return r->id;
    }
    return std::nullopt;
}

std::optional<Engine::EntityId> HarmonicsEngine::placeDissonance(const Engine::Vec2& position, DissonanceType type,
                                                                 EnergyType countersEnergy, float disruptionLevel) {
    if (deferIfDispatching("placeDissonance", [=]() { placeDissonance(position, type, countersEnergy, disruptionLevel); })) {
        return std::nullopt;
    }
    Dissonance d = makeDissonance(ids_, position, type, countersEnergy, config_);
    d.disruptionLevel = disruptionLevel;
    dissonances_.push_back(d);
    return d.id;
}

std::optional<Engine::EntityId> HarmonicsEngine::placeAmplifier(const Engine::Vec2& position, AmplifierType type,
                                                                EnergyType energyType) {
    if (deferIfDispatching("placeAmplifier", [=]() { placeAmplifier(position, type, energyType); })) {
        return std::nullopt;
    }
    Amplifier a = makeAmplifier(ids_, position, type, energyType, config_);
    amplifiers_.push_back(a);
    return a.id;
}

EngineSnapshot HarmonicsEngine::snapshot() const {
    EngineSnapshot s;
    s.state = machine_.state();
    s.core = core_;
    s.dissonances = dissonances_;
    s.amplifiers = amplifiers_;
    s.resonators = harmonic_.resonators();
    s.waves = harmonic_.waves();
    s.connections = harmonic_.connections();
    s.patterns = harmonic_.patterns();
    s.score = score_;
    s.fps = fps_;
    s.clock = clock_;
    s.collisionCooldown = collision_.cooldownRemaining();
    s.patternsCompleted = harmonic_.patternsCompleted();
    return s;
}

void HarmonicsEngine::emit(GameEventType type, nlohmann::json data) {
    GameEvent event;
    event.type = type;
    event.timestamp = clock_;
    event.data = std::move(data);
    bus_.emit(std::move(event));
}

bool HarmonicsEngine::deferIfDispatching(const char* command, std::function<void()> fn) {
    if (!bus_.dispatching()) return false;
    Engine::logDebug(std::string("Deferring ") + command + " issued during event dispatch.");
    deferred_.push_back(std::move(fn));
    return true;
}

void HarmonicsEngine::runDeferred() {
    if (deferred_.empty()) return;
    auto commands = std::move(deferred_);
    deferred_.clear();
    for (auto& command : commands) {
        command();
    }
}

void HarmonicsEngine::flushEvents() {
    if (inTick_ || bus_.dispatching()) return;
    for (int pass = 0; pass < kMaxFlushPasses; ++pass) {
        bus_.drain();
        if (deferred_.empty()) return;
        runDeferred();
    }
    if (!deferred_.empty() || bus_.pending() != 0) {
        Engine::logWarn("Event flush did not settle; remaining work runs next tick.");
    }
}

void HarmonicsEngine::startDriver() {
    if (driver_) driver_->startTicking();
}

void HarmonicsEngine::stopDriver() {
    if (driver_) driver_->stopTicking();
}

}  // namespace Zen
