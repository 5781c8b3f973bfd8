// Minimal sanity checks for the background interference field and particles.
#include <cassert>
#include <cmath>
#include "../game/GameConfig.h"
#include "../game/visual/FieldVisualizer.h"

using namespace Zen;

int main() {
    {
        VisualSettings settings{};
        settings.fieldResolution = 10;
        FieldVisualizer field(3u);
        field.configure(settings, 550.0f, 550.0f);
        assert(field.columns() == 55);
        assert(field.rows() == 55);
        assert(field.field().size() == 55u * 55u);
        assert(static_cast<int>(field.particles().size()) == settings.particleCount);
        assert(field.sources().size() == 6);

        for (int i = 0; i < 600; ++i) {
            if (i % 120 == 0) field.registerInteraction();
            field.update(1.0f / 60.0f);
        }
        for (float v : field.field()) {
            assert(std::isfinite(v));
            // Six unit-ish sources can never sum past their combined amplitude.
            assert(std::abs(v) <= 6.5f);
        }
        for (const auto& p : field.particles()) {
            assert(std::isfinite(p.position.x) && std::isfinite(p.position.y));
            assert(p.radius >= 0.0f && p.radius <= settings.maxRadius);
            assert(p.life > 0.0f && p.life <= 1.0f);
        }
        assert(std::isfinite(field.stability()));
        assert(field.time() > 9.9);
    }
    {
        FieldVisualizer field;
        field.configure(VisualSettings{}, 550.0f, 550.0f);
        assert(field.mode() == VisualMode::Zen);
        assert(field.cycleMode() == VisualMode::Flow);
        assert(field.cycleMode() == VisualMode::Challenge);
        assert(field.challengeIntensity() == 0.0f);
        for (int i = 0; i < 600; ++i) field.update(1.0f / 60.0f);
        const float ramped = field.challengeIntensity();
        assert(ramped > 0.0f && ramped <= 2.0f);
        field.registerInteraction();
        assert(field.challengeIntensity() > ramped);
        assert(field.cycleMode() == VisualMode::Zen);
        assert(field.challengeIntensity() == 0.0f);
    }
    {
        // Zero or negative steps do not advance time.
        FieldVisualizer field;
        field.configure(VisualSettings{}, 200.0f, 100.0f);
        field.update(0.0f);
        field.update(-1.0f);
        assert(field.time() == 0.0);
        assert(field.center().x == 100.0f && field.center().y == 50.0f);
    }
    return 0;
}
