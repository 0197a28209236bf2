#pragma once
// Kavacha: safety armor for an autonomous agent
//
// Three independent layers:
// - Gödel immunity: flags and redacts adversarial text before it is processed
// - Dual mind: two independent passes must agree before an action is committed
// - Sacred core: sealed, tamper-evident registry of critical operations
//
// Plus the shared pieces: errors, events, logging, config, JSON views.

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "events.hpp"
#include "attack_patterns.hpp"
#include "godel_immunity.hpp"
#include "reasoner.hpp"
#include "verdict_parser.hpp"
#include "dual_mind.hpp"
#include "sacred_core.hpp"
#include "serialize.hpp"
#include "config.hpp"
