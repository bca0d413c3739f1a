#pragma once

#include "certchain/certchain.hpp"
