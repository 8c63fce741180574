#pragma once

// Single include for applications embedding the surety engine

#include "surety/surety.hpp"
