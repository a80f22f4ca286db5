#pragma once

#define PRATYAYA_VERSION "1.0.0"
