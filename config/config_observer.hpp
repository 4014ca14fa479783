#pragma once

namespace pushhub {
    namespace config {
        struct GlobalConfig;

        // Notified after every (re)load of the configuration file.
        class ConfigObserver {
        public:
            virtual ~ConfigObserver() = default;
            virtual void onConfigReloaded(const pushhub::config::GlobalConfig &newConfig) = 0;
        };
    }// namespace config
}// namespace pushhub
