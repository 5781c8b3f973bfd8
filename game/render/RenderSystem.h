// Draws an engine snapshot and the background field with rects and lines.
#pragma once

#include "../../engine/render/RenderDevice.h"
#include "../EngineSnapshot.h"
#include "../GameConfig.h"
#include "../visual/FieldVisualizer.h"

namespace Zen {

class RenderSystem {
public:
    explicit RenderSystem(Engine::RenderDevice& device) : device_(device) {}

    void draw(const EngineSnapshot& snapshot, const FieldVisualizer& field, const GameConfig& cfg);

private:
    void drawField(const FieldVisualizer& field, bool playing);
    void drawParticles(const FieldVisualizer& field);
    void drawWaves(const EngineSnapshot& snapshot);
    void drawResonators(const EngineSnapshot& snapshot);
    void drawEntities(const EngineSnapshot& snapshot);
    void drawCore(const EngineSnapshot& snapshot);
    void drawHud(const EngineSnapshot& snapshot, const GameConfig& cfg);
    void drawCircle(const Engine::Vec2& center, float radius, const Engine::Color& color, int segments = 32);
    void drawDisc(const Engine::Vec2& center, float radius, const Engine::Color& color);

    Engine::RenderDevice& device_;
};

}  // namespace Zen
