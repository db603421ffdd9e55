#pragma once
#include "embedder.hpp"
#include "llm.hpp"
#include "startup.hpp"
#include "vector_index.hpp"
#include <string>

struct ServiceConfig {
    int port{8000};
    EmbedConfig embed;
    LlmConfig llm;
    IndexManagerOptions index;
    StartupOptions startup;
};

// Environment variables over built-in defaults. Invalid numbers keep the default.
ServiceConfig load_config_from_env();
