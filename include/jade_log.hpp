// jade_log.hpp - JSON Authored Document Engine (Jade) - Diagnostics
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JADE_LOG_HPP
#define JADE_LOG_HPP

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace jade::log
{
    using severity = boost::log::trivial::severity_level;

    // Drops every record below `min`. Applies to the whole process, since
    // the engine logs through the global Boost.Log core.
    inline void set_level(severity min)
    {
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= min);
    }

    inline void set_enabled(bool on)
    {
        boost::log::core::get()->set_logging_enabled(on);
    }
}

#define JADE_LOG(lvl) BOOST_LOG_TRIVIAL(lvl) << "jade: "

#endif // JADE_LOG_HPP
