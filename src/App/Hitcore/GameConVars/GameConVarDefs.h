#ifndef GAME_CONVARDEFS_H
#define GAME_CONVARDEFS_H

// put gameplay-related convars in this file (NOT ConVarDefs.h)

// NOLINTBEGIN(misc-definitions-in-headers)

#define _CV(name) name

// defined and included at the end of GameConVars.cpp
#if defined(DEFINE_GAME_CONVARS)
#undef CONVAR
#define CONVAR(name, ...) ConVar _CV(name)(#name __VA_OPT__(, ) __VA_ARGS__)
#else
#define CONVAR(name, ...) extern ConVar _CV(name)
#endif

class ConVar;
namespace cv {

// Difficulty
CONVAR(approachtime_max, 450, CLIENT | PROTECTED | GAMEPLAY);
CONVAR(approachtime_mid, 1200, CLIENT | PROTECTED | GAMEPLAY);
CONVAR(approachtime_min, 1800, CLIENT | PROTECTED | GAMEPLAY);

// Beatmap loading
CONVAR(beatmap_max_num_hitobjects, 40000, CLIENT | PROTECTED | GAMEPLAY,
       "maximum number of total allowed hitobjects per beatmap (prevent crashing on deliberate game-breaking beatmaps)");
CONVAR(slider_curve_max_length, 65536.f / 2.f, CLIENT | PROTECTED | GAMEPLAY,
       "maximum slider length in osu!pixels (i.e. pixelLength). also used to clamp all (control-)point coordinates "
       "to sane values.");
CONVAR(slider_curve_max_points, 9999.0f, CLIENT | PROTECTED | GAMEPLAY,
       "maximum number of allowed interpolated curve points. quality will be forced to go down if a slider has more "
       "steps than this");
CONVAR(slider_curve_points_separation, 2.5f, CLIENT,
       "slider body curve approximation step width in osu!pixels, don't set this lower than around 1.5");
CONVAR(slider_max_repeats, 9000, CLIENT | PROTECTED | GAMEPLAY,
       "maximum number of repeats allowed per slider (clamp range)");

// Session timing
CONVAR(lead_in_time, 2000.0f, CLIENT | PROTECTED | GAMEPLAY,
       "Duration in ms of the preamble before the song starts, the chart's AudioLeadIn wins if it is longer");
CONVAR(skip_lead_time, 2000.0f, CLIENT | PROTECTED | GAMEPLAY,
       "skipping the intro jumps to this many ms before the first hitobject, and is only allowed before that point");
CONVAR(end_grace_time, 1000.0f, CLIENT | GAMEPLAY,
       "Duration in ms which is added at the end of a beatmap after the last hitobject is finished, before the run "
       "counts as completed");
CONVAR(fadeout_time, 500.0f, CLIENT | GAMEPLAY,
       "in milliseconds, how long a hitobject stays visible after its end time");
CONVAR(stale_audio_frame_delta, 16.67f, CLIENT | GAMEPLAY,
       "in milliseconds, how far the clock advances per tick (times the speed multiplier) while the audio position is "
       "stale");

// Health
CONVAR(drain_disabled, false, CLIENT | PROTECTED | GAMEPLAY,
       "determines if passive HP drain should be disabled entirely");
CONVAR(drain_rate_scale, 0.05f, CLIENT | PROTECTED | GAMEPLAY,
       "health drained per second is HP * this * mod drain multiplier (times 1000 ms of clock)");
CONVAR(hit_health_base, 2.0f, CLIENT | PROTECTED | GAMEPLAY,
       "a 300 restores (10 - HP) * this much health, a 100 half of that, a 50 a quarter");
CONVAR(miss_health_penalty, 15.0f, CLIENT | PROTECTED | GAMEPLAY);

// Automation
CONVAR(autoplay_snap_time, 50.0f, CLIENT | GAMEPLAY,
       "the autoplay cursor snaps onto the next hitobject once it is this many ms away, and eases towards it before");
CONVAR(autoplay_ease_factor, 0.2f, CLIENT | GAMEPLAY);
CONVAR(relax_hit_lenience, 10.0f, CLIENT | GAMEPLAY,
       "in milliseconds, how close to a hitobject's time automated clicks are fired");

// Renderer snapshot
CONVAR(cursor_trail_length, 16, CLIENT, "number of cursor positions kept for the trail");
CONVAR(hitmarker_duration, 300.0f, CLIENT, "in milliseconds, how long hit markers stay visible");

// Scores
CONVAR(score_db_path, "hitcore_scores.db"sv, CLIENT, "local best-score database file");

// Debug
CONVAR(debug_judgement, false, CLIENT, "log every judgement and state transition");

// NOLINTEND(misc-definitions-in-headers)

}  // namespace cv

#endif
