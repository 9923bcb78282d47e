/*

Copyright (c) 2025, curlagent project
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLAGENT_EXPORT_HPP_INCLUDED
#define CURLAGENT_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

#if defined CURLAGENT_BUILDING_SHARED
# define CURLAGENT_EXPORT BOOST_SYMBOL_EXPORT
#elif defined CURLAGENT_LINKING_SHARED
# define CURLAGENT_EXPORT BOOST_SYMBOL_IMPORT
#endif

// when this is specified, export a bunch of extra
// symbols, mostly for the unit tests to reach
#if defined CURLAGENT_EXPORT_EXTRA
# if defined CURLAGENT_BUILDING_SHARED
#  define CURLAGENT_EXTRA_EXPORT BOOST_SYMBOL_EXPORT
# elif defined CURLAGENT_LINKING_SHARED
#  define CURLAGENT_EXTRA_EXPORT BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef CURLAGENT_EXPORT
# define CURLAGENT_EXPORT
#endif

#ifndef CURLAGENT_EXTRA_EXPORT
# define CURLAGENT_EXTRA_EXPORT
#endif

#endif
