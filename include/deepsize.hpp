#pragma once

/*
===============================================================================
deepsize: Public API Entry Point
===============================================================================

deepsize reports the true memory cost of holding a value: its in-place
representation plus every heap allocation it transitively owns, counting
shared allocations once and terminating on cyclic ownership graphs.

    #include <deepsize.hpp>

    std::size_t bytes = deepsize::deep_size_of(value);

Include this header rather than the individual impls/ headers: Sizable is a
concept, and a type checked before its implementation header was included
stays non-sizable for the rest of the translation unit.
===============================================================================
*/

#include <deepsize/config.hpp>
#include <deepsize/identity.hpp>
#include <deepsize/context.hpp>
#include <deepsize/footprint.hpp>
#include <deepsize/size_of.hpp>
#include <deepsize/impls/primitives.hpp>
#include <deepsize/impls/containers.hpp>
#include <deepsize/impls/pointers.hpp>
#include <deepsize/impls/utility.hpp>
#include <deepsize/derive.hpp>
