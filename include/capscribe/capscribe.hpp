#pragma once

// Umbrella header

#include "capscribe/batch.hpp"
#include "capscribe/cli.hpp"
#include "capscribe/error.hpp"
#include "capscribe/log.hpp"
#include "capscribe/normalize.hpp"
#include "capscribe/parse.hpp"
#include "capscribe/segmenter.hpp"
#include "capscribe/speaker.hpp"
#include "capscribe/time.hpp"
#include "capscribe/webvtt.hpp"
