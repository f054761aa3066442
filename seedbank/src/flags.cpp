#include "flags.hpp"

namespace seedbank
{
namespace flags
{

bool FLAG_debug = false;

}
}
