#pragma once

#include "heirloom/heirloom.hpp"
