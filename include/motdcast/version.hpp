//
// version.hpp
// ~~~~~~~~~~~
//
// Copyright (c) 2026 The motdcast authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MOTDCAST_VERSION_HPP_INCLUDED
#define MOTDCAST_VERSION_HPP_INCLUDED

#pragma once

#define MOTDCAST_VERSION_MAJOR 1
#define MOTDCAST_VERSION_MINOR 1
#define MOTDCAST_VERSION_PATCH 0

#define MOTDCAST_VERSION_STRING "1.1.0"

#endif /* MOTDCAST_VERSION_HPP_INCLUDED */
