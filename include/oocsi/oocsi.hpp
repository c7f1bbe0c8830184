#pragma once

#include "client.hpp"
#include "device.hpp"
#include "event.hpp"
#include "framer.hpp"
#include "identity.hpp"
#include "registry.hpp"
#include "transport.hpp"
#include "variable.hpp"
