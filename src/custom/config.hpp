#pragma once

namespace lens {

struct Config;
struct Theme;

namespace custom {

/// Called when an engine is about to be created.  `config` starts out with the
/// default settings; change them here.
void config_created_callback(Config* config);

/// Fill in the faces used to draw lenses.
void create_theme(Theme& theme);

}
}
