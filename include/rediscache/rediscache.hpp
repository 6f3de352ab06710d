#pragma once

#include <rediscache/cache/driver.hpp>
#include <rediscache/client.hpp>
#include <rediscache/config.hpp>
#include <rediscache/driver.hpp>
#include <rediscache/error.hpp>
#include <rediscache/error_info.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/key.hpp>
#include <rediscache/logger.hpp>
#include <rediscache/options.hpp>
#include <rediscache/pool.hpp>
#include <rediscache/pooled_driver.hpp>
#include <rediscache/redis_error.hpp>
#include <rediscache/request.hpp>
