// Single translation unit carrying the stb_truetype implementation.
#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"
