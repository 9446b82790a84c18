#pragma once

#define GREEIRDECODER_VERSION_MAJOR 0
#define GREEIRDECODER_VERSION_MINOR 1
#define GREEIRDECODER_VERSION_PATCH 0
#define GREEIRDECODER_VERSION_STR "0.1.0"
