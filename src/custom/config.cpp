#include "config.hpp"

#include <tracy/Tracy.hpp>
#include "core/config.hpp"
#include "core/theme.hpp"

namespace lens {
namespace custom {

void config_created_callback(Config* config) {
    ZoneScoped;

    config->nearest_only = false;
    config->nearest_float_when = Float_When::AUTO;
    config->calm_down = false;
    config->refresh_delay = std::chrono::milliseconds(150);
}

void create_theme(Theme& theme) {
    ZoneScoped;

    theme.faces[Face_Type::LENS_PADDING] = {-1, -1, 0};
    theme.faces[Face_Type::LENS] = {245, 236, 0};
    theme.faces[Face_Type::LENS_NEAR] = {39, 236, Face::BOLD};
    theme.faces[Face_Type::NEAR_MATCH] = {-1, -1, Face::REVERSE};
}

}
}
