#pragma once

#include <barrace/assets.hpp>
#include <barrace/bar_race.hpp>
#include <barrace/chart_options.hpp>
#include <barrace/color.hpp>
#include <barrace/csv_table.hpp>
#include <barrace/error.hpp>
#include <barrace/export.hpp>
#include <barrace/frame.hpp>
#include <barrace/layout.hpp>
#include <barrace/logger.hpp>
#include <barrace/rank_smoother.hpp>
#include <barrace/render_plan.hpp>
#include <barrace/renderer.hpp>
#include <barrace/resampler.hpp>
#include <barrace/series_naming.hpp>
#include <barrace/series_table.hpp>
