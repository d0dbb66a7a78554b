/**
 * @file boost_config.h
 * @brief Boost.Thread feature selection
 *
 * Must precede every Boost.Thread include: boost::async and move-only
 * boost::future need thread version 4.
 */

#pragma once

#ifndef BOOST_THREAD_VERSION
#define BOOST_THREAD_VERSION 4
#endif

#ifndef BOOST_THREAD_PROVIDES_FUTURE
#define BOOST_THREAD_PROVIDES_FUTURE
#endif
