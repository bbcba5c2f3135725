#pragma once

#include "chain_error.hpp"
#include "address.hpp"
#include "storage_slot.hpp"
