#include "RenderSystem.h"

#include <algorithm>
#include <cmath>

#include "../EntityFactories.h"

namespace Zen {

namespace {
constexpr float kTwoPi = 6.2831853f;
constexpr int kFieldStride = 3;  // draw every third field sample

const Engine::Color kPlayBackground{15, 22, 36, 255};
const Engine::Color kMenuBackground{245, 243, 235, 255};

Engine::Color hslToColor(float hue, float saturation, float lightness, float alpha) {
    const float c = (1.0f - std::abs(2.0f * lightness - 1.0f)) * saturation;
    const float hp = std::fmod(hue, 360.0f) / 60.0f;
    const float x = c * (1.0f - std::abs(std::fmod(hp, 2.0f) - 1.0f));
    float r = 0.0f, g = 0.0f, b = 0.0f;
    if (hp < 1.0f) {
        r = c, g = x;
    } else if (hp < 2.0f) {
        r = x, g = c;
    } else if (hp < 3.0f) {
        g = c, b = x;
    } else if (hp < 4.0f) {
        g = x, b = c;
    } else if (hp < 5.0f) {
        r = x, b = c;
    } else {
        r = c, b = x;
    }
    const float m = lightness - c * 0.5f;
    auto channel = [m](float v) { return static_cast<unsigned char>(std::clamp((v + m) * 255.0f, 0.0f, 255.0f)); };
    return Engine::Color{channel(r), channel(g), channel(b),
                         static_cast<unsigned char>(std::clamp(alpha, 0.0f, 1.0f) * 255.0f)};
}
}  // namespace

void RenderSystem::draw(const EngineSnapshot& snapshot, const FieldVisualizer& field, const GameConfig& cfg) {
    const bool playing = snapshot.state == GameState::Playing || snapshot.state == GameState::Paused;
    device_.clear(playing ? kPlayBackground : kMenuBackground);
    drawField(field, playing);
    drawParticles(field);
    drawWaves(snapshot);
    drawResonators(snapshot);
    drawEntities(snapshot);
    drawCore(snapshot);
    drawHud(snapshot, cfg);
}

void RenderSystem::drawField(const FieldVisualizer& field, bool playing) {
    const float res = static_cast<float>(field.resolution());
    const float block = res * kFieldStride;
    const auto& values = field.field();
    for (int y = 0; y < field.rows(); y += kFieldStride) {
        for (int x = 0; x < field.columns(); x += kFieldStride) {
            const float v = values[static_cast<std::size_t>(y) * field.columns() + x];
            const float strength = std::min(1.0f, std::abs(v));
            if (strength < 0.05f) continue;
            const float hue = v > 0.0f ? 190.0f : 260.0f;
            const float alpha = strength * (playing ? 0.18f : 0.08f);
            device_.drawFilledRect(Engine::Vec2{x * res, y * res}, Engine::Vec2{block, block},
                                   hslToColor(hue, 0.6f, 0.6f, alpha));
        }
    }
}

void RenderSystem::drawParticles(const FieldVisualizer& field) {
    for (const auto& p : field.particles()) {
        const float half = p.size * 0.5f;
        device_.drawFilledRect(p.position - Engine::Vec2{half, half}, Engine::Vec2{p.size, p.size},
                               hslToColor(p.hue, 0.7f, 0.6f, p.opacity * p.life));
    }
}

void RenderSystem::drawWaves(const EngineSnapshot& snapshot) {
    for (const auto& w : snapshot.waves) {
        drawCircle(w.origin, w.radius, Engine::withOpacity(colorFor(w.energyType), w.opacity), 48);
    }
}

void RenderSystem::drawResonators(const EngineSnapshot& snapshot) {
    for (const auto& c : snapshot.connections) {
        const Resonator* a = nullptr;
        const Resonator* b = nullptr;
        for (const auto& r : snapshot.resonators) {
            if (r.id == c.resonatorIds[0]) a = &r;
            if (r.id == c.resonatorIds[1]) b = &r;
        }
        if (a && b) {
            device_.drawLine(a->position, b->position, Engine::withOpacity(colorFor(c.energyType), c.intensity));
        }
    }
    for (const auto& r : snapshot.resonators) {
        const auto color = Engine::withOpacity(colorFor(r.energyType), r.intensity);
        drawDisc(r.position, r.radius, color);
        if (r.isActivated) {
            drawCircle(r.position, r.radius + 4.0f, color, 16);
        }
    }
}

void RenderSystem::drawEntities(const EngineSnapshot& snapshot) {
    for (const auto& d : snapshot.dissonances) {
        const auto color = Engine::withOpacity(d.color, d.opacity);
        if (d.shape == DissonanceShape::Square || d.shape == DissonanceShape::Irregular) {
            // Rotated outline stands in for the sprite.
            Engine::Vec2 corners[4];
            for (int i = 0; i < 4; ++i) {
                const float a = d.rotation + kTwoPi * (static_cast<float>(i) + 0.5f) / 4.0f;
                corners[i] = d.position + Engine::Vec2{std::cos(a), std::sin(a)} * d.radius;
            }
            for (int i = 0; i < 4; ++i) {
                device_.drawLine(corners[i], corners[(i + 1) % 4], color);
            }
        } else if (d.shape == DissonanceShape::Triangle) {
            drawCircle(d.position, d.radius, color, 3);
        } else {
            drawDisc(d.position, d.radius, color);
        }
    }
    for (const auto& a : snapshot.amplifiers) {
        drawDisc(a.position, a.radius * 0.6f, Engine::withOpacity(a.color, a.opacity));
        drawCircle(a.position, a.radius, Engine::withOpacity(a.color, a.opacity), 20);
    }
}

void RenderSystem::drawCore(const EngineSnapshot& snapshot) {
    const auto& core = snapshot.core;
    Engine::Color glow{255, 240, 200, 255};
    glow = Engine::withOpacity(glow, core.brightness);
    if (isInvulnerable(snapshot) && static_cast<int>(snapshot.clock * 20.0) % 2 == 0) {
        glow.a /= 3;
    }
    drawDisc(core.position, core.radius, glow);
    drawCircle(core.position, core.radius + 3.0f * static_cast<float>(core.harmonyLevel), glow, 40);
}

void RenderSystem::drawHud(const EngineSnapshot& snapshot, const GameConfig& cfg) {
    const Engine::Vec2 origin{12.0f, 12.0f};
    const float barW = 160.0f;
    device_.drawFilledRect(origin, Engine::Vec2{barW, 8.0f}, Engine::Color{255, 255, 255, 40});
    device_.drawFilledRect(origin, Engine::Vec2{barW * energyRatio(snapshot), 8.0f}, Engine::Color{255, 220, 120, 220});

    const float total = std::max(1e-3f, snapshot.core.energyBalance.total());
    float x = origin.x;
    for (auto type : kAllEnergyTypes) {
        const float w = barW * snapshot.core.energyBalance[type] / total;
        device_.drawFilledRect(Engine::Vec2{x, origin.y + 12.0f}, Engine::Vec2{w, 4.0f}, colorFor(type));
        x += w;
    }

    const float progress = harmonyProgress(snapshot, cfg.harmony.patternsPerHarmonyLevel);
    for (int i = 0; i < snapshot.core.harmonyLevel; ++i) {
        device_.drawFilledRect(Engine::Vec2{origin.x + i * 10.0f, origin.y + 20.0f}, Engine::Vec2{6.0f, 6.0f},
                               Engine::Color{200, 180, 255, 220});
    }
    device_.drawFilledRect(Engine::Vec2{origin.x, origin.y + 30.0f}, Engine::Vec2{barW * progress, 2.0f},
                           Engine::Color{200, 180, 255, 160});

    if (snapshot.state == GameState::Paused) {
        device_.drawFilledRect(Engine::Vec2{0.0f, 0.0f}, Engine::Vec2{cfg.field.width, cfg.field.height},
                               Engine::Color{0, 0, 0, 100});
    }
}

void RenderSystem::drawCircle(const Engine::Vec2& center, float radius, const Engine::Color& color, int segments) {
    if (radius <= 0.0f || segments < 3) return;
    Engine::Vec2 prev = center + Engine::Vec2{radius, 0.0f};
    for (int i = 1; i <= segments; ++i) {
        const float a = kTwoPi * static_cast<float>(i) / static_cast<float>(segments);
        const Engine::Vec2 next = center + Engine::Vec2{std::cos(a), std::sin(a)} * radius;
        device_.drawLine(prev, next, color);
        prev = next;
    }
}

void RenderSystem::drawDisc(const Engine::Vec2& center, float radius, const Engine::Color& color) {
    // Stack of horizontal spans; cheap enough for the handful of discs per frame.
    const int r = static_cast<int>(radius);
    for (int dy = -r; dy <= r; dy += 2) {
        const float half = std::sqrt(std::max(0.0f, radius * radius - static_cast<float>(dy * dy)));
        device_.drawFilledRect(Engine::Vec2{center.x - half, center.y + static_cast<float>(dy)},
                               Engine::Vec2{half * 2.0f, 2.0f}, color);
    }
}

}  // namespace Zen
