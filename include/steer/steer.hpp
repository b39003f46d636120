#ifndef STEER_HPP
#define STEER_HPP

// Main header that includes everything

#include <steer/channel.hpp>
#include <steer/errors.hpp>
#include <steer/interruption_tracker.hpp>
#include <steer/log.hpp>
#include <steer/normalizer.hpp>
#include <steer/orchestrator.hpp>
#include <steer/prompt.hpp>
#include <steer/query_registry.hpp>
#include <steer/session_directory.hpp>
#include <steer/settings.hpp>
#include <steer/subprocess_channel.hpp>
#include <steer/transcript_store.hpp>
#include <steer/types.hpp>
#include <steer/usage.hpp>
#include <steer/version.hpp>

#endif // STEER_HPP
