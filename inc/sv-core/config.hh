#pragma once

#define SV_CONFIG_DEBUG_MODE                            (0)

// default object-count threshold above which an allocation triggers a collection
#define SV_CONFIG_DEFAULT_MAX_OBJECTS                   (10)

// debug configs: enable/disable to turn on/off specific debug features
#define SV_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS           (0)
#define SV_CONFIG_PRINT_EACH_INSTRUCTION_ON_EXECUTION   (0)
