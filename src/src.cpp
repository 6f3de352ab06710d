#include <rediscache/src.hpp>
