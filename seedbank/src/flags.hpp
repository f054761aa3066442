// flags.hpp
//
// Makes global flags available

#pragma once

#include <cstdint>

namespace seedbank
{
namespace flags
{

/**
 * Enables debug output
 */
extern bool FLAG_debug;

}
}
