#pragma once

#define VERSION "0.3.0"
