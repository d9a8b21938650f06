/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_HPP
#define __LEOSIM_HPP

#include <leosim/config.hpp>
#include <leosim/elements.hpp>
#include <leosim/propagator.hpp>
#include <leosim/simulation.hpp>
#include <leosim/report.hpp>

#endif
