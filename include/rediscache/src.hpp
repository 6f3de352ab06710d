#pragma once

// Out-of-line definitions. Include from exactly one translation unit of the final program.

#include <rediscache/impl/assert.ipp>

#include <iocoro/impl.hpp>
#include <iocoro/impl/ip/address.ipp>
#include <iocoro/impl/ip/endpoint_storage.ipp>
