// This is copyrighted software. More information is at the end of this file.
#include <gavel/config.hh>
#include <failsafe/failsafe.hh>

#include <cstdlib>
#include <string>

namespace gavel {
    engine_config engine_config::from_environment() {
        engine_config cfg;

        if (const char* root = std::getenv("GAVEL_ASSET_ROOT")) {
            cfg.asset_root = root;
        }

        if (const char* delay = std::getenv("GAVEL_READINESS_DELAY_MS")) {
            char* end = nullptr;
            const long ms = std::strtol(delay, &end, 10);
            if (end == delay || *end != '\0' || ms < 0) {
                LOG_WARN("engine_config", "Ignoring GAVEL_READINESS_DELAY_MS:", delay);
            } else {
                cfg.readiness_delay = std::chrono::milliseconds(ms);
            }
        }
        return cfg;
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of gavel.
 *
 * gavel is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * gavel is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with gavel.  If not, see <http://www.gnu.org/licenses/>.
 */
