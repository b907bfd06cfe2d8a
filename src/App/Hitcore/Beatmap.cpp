// Copyright (c) 2020, PG & 2026, hitcore contributors, All rights reserved.
#include "Beatmap.h"

#include "GameConVars.h"
#include "GameRules.h"
#include "Logging.h"
#include "Parsing.h"
#include "SString.h"

#include "fmt/format.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <optional>

namespace {  // internal helpers

bool parse_timing_point(std::string_view curLine, Beatmap::TIMINGPOINT &out) {
    // old beatmaps: Offset, Milliseconds per Beat
    // new beatmaps: Offset, Milliseconds per Beat, Meter, sampleSet, sampleIndex, Volume, Uninherited, Effects
    thread_local std::vector<std::string_view> csvs;
    SString::split(csvs, curLine, ',');
    if(csvs.size() < 2) return false;

    const auto offset = Parsing::strto<f64>(csvs[0]);
    const auto msPerBeat = Parsing::strto<f64>(csvs[1]);
    if(!offset || !msPerBeat) return false;

    out.offset = std::round(*offset);
    out.msPerBeat = *msPerBeat;
    out.meter = 4;
    out.kiai = false;
    // without the field, a negative beat length is what marks an inherited point
    out.uninherited = out.msPerBeat >= 0;

    if(csvs.size() > 2) {
        if(auto meter = Parsing::strto<i32>(csvs[2]); meter && *meter > 0) out.meter = *meter;
    }
    if(csvs.size() > 6) {
        if(auto uninherited = Parsing::strto<i32>(csvs[6])) out.uninherited = *uninherited == 1;
    }
    if(csvs.size() > 7) {
        if(auto effects = Parsing::strto<i32>(csvs[7])) out.kiai = (*effects & 1) != 0;
    }

    return true;
}

bool timingPointSortComparator(const Beatmap::TIMINGPOINT &a, const Beatmap::TIMINGPOINT &b) {
    if(a.offset != b.offset) return a.offset < b.offset;

    // uninherited timingpoints go before inherited timingpoints
    if(a.uninherited != b.uninherited) return a.uninherited;

    return false;  // equivalent
}

// 64-bit FNV-1a
u64 hash_text(std::string_view text) {
    u64 hash = 0xcbf29ce484222325ULL;
    for(const char c : text) {
        hash ^= static_cast<u8>(c);
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

forceinline f32 clamp_difficulty(f32 value) { return std::clamp<f32>(value, 0.0f, 10.0f); }

forceinline std::string_view strip_quotes(std::string_view str) {
    SString::trim_inplace(str);
    if(str.size() >= 2 && str.front() == '"' && str.back() == '"') str = str.substr(1, str.size() - 2);
    return str;
}

}  // namespace

Beatmap::LOAD_RESULT Beatmap::loadFromFile(std::string_view osuFilePath) {
    LOAD_RESULT result;

    std::string fileData;
    {
        std::ifstream file{std::string{osuFilePath}, std::ios::binary};
        if(file.good()) {
            fileData.assign(std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{});
        }
        // close the file here
    }

    if(fileData.empty()) {
        debugLog("File: {} could not be read", osuFilePath);
        result.error.errc = LoadError::FILE_LOAD;
        return result;
    }

    result = parse(fileData);
    if(result.error) {
        debugLog("File: {} rejected: {}", osuFilePath, result.error.error_string());
    }
    return result;
}

Beatmap::LOAD_RESULT Beatmap::parse(std::string_view beatmapFile) {
    thread_local std::vector<std::string_view> spbuf1, spbuf2;  // "spbuf" == SString::split buffer

    LOAD_RESULT result;

    if(SString::is_wspace_only(beatmapFile)) {
        result.error.errc = LoadError::FILE_LOAD;
        return result;
    }

    // utf-8 bom
    if(beatmapFile.starts_with("\xEF\xBB\xBF")) beatmapFile.remove_prefix(3);

    auto beatmap = std::shared_ptr<Beatmap>(new Beatmap());
    Beatmap &b = *beatmap;

    const f32 sliderSanityRange = cv::slider_curve_max_length.getFloat();
    const i32 sliderMaxRepeatRange = std::max(cv::slider_max_repeats.getInt(), 1);

    std::array<std::optional<Color>, 8> tempColors;
    std::optional<f32> approachRate;
    bool hasHitObjectsSection = false;
    BlockId curBlock{BlockId::Sentinel};

    using enum BlockId;

    for(auto curLine : SString::split_newlines(beatmapFile)) {
        SString::trim_inplace(curLine);

        // ignore comments, but only if at the beginning of a line (e.g. allow Artist:DJ'TEKINA//SOMETHING)
        if(curLine.empty() || SString::is_comment(curLine)) continue;

        if(curLine.front() == '[' && curLine.back() == ']') {
            const auto it = std::ranges::find(metadataBlocks, curLine, &MetadataBlock::str);
            curBlock = it != metadataBlocks.end() ? it->id : Unknown;
            if(curBlock == HitObjects) hasHitObjectsSection = true;
            continue;
        }

        // anything before the first section is the header
        if(curBlock == Sentinel) curBlock = Header;

        switch(curBlock) {
            case Sentinel:
            case Unknown:
                break;

            // (e.g. "osu file format v14")
            case Header: {
                Parsing::parse(curLine, "osu file format v", &b.iVersion);
                break;
            }

            case General: {
                Parsing::parse(curLine, "AudioFilename", ':', &b.sAudioFileName);
                Parsing::parse(curLine, "AudioLeadIn", ':', &b.iAudioLeadIn);
                break;
            }

            case Metadata: {
                Parsing::parse(curLine, "Title", ':', &b.sTitle);
                Parsing::parse(curLine, "Artist", ':', &b.sArtist);
                Parsing::parse(curLine, "Creator", ':', &b.sCreator);
                Parsing::parse(curLine, "Version", ':', &b.sDifficultyName);
                Parsing::parse(curLine, "BeatmapID", ':', &b.iID);
                break;
            }

            case Difficulty: {
                f32 value{};
                if(Parsing::parse(curLine, "ApproachRate", ':', &value)) approachRate = value;
                Parsing::parse(curLine, "CircleSize", ':', &b.difficulty.CS);
                Parsing::parse(curLine, "OverallDifficulty", ':', &b.difficulty.OD);
                Parsing::parse(curLine, "HPDrainRate", ':', &b.difficulty.HP);
                Parsing::parse(curLine, "SliderMultiplier", ':', &b.fSliderMultiplier);
                Parsing::parse(curLine, "SliderTickRate", ':', &b.fSliderTickRate);
                break;
            }

            case Events: {
                std::vector<std::string_view> &csvs = spbuf1;
                SString::split(csvs, curLine, ',');
                if(csvs.size() < 3) break;

                const std::string_view eventType = SString::trimmed(csvs[0]);
                if(eventType == "0" || eventType == "Background") {
                    b.sBackgroundImageFileName = strip_quotes(csvs[2]);
                } else if(eventType == "2" || eventType == "Break") {
                    const auto startTime = Parsing::strto<i64>(csvs[1]);
                    const auto endTime = Parsing::strto<i64>(csvs[2]);
                    if(startTime && endTime && *endTime > *startTime) {
                        b.breaks.push_back(BREAK{.startTime = *startTime, .endTime = *endTime});
                    }
                }
                break;
            }

            case TimingPoints: {
                TIMINGPOINT t{};
                if(parse_timing_point(curLine, t)) {
                    b.timingpoints.push_back(t);
                }
                break;
            }

            case Colours: {
                u8 comboNum;
                u8 r, g, bl;

                if(Parsing::parse(curLine, "Combo", &comboNum, ':', &r, ',', &g, ',', &bl)) {
                    if(comboNum >= 1 && comboNum <= 8) {  // bare minimum validation effort
                        tempColors[comboNum - 1] = rgb(r, g, bl);
                    }
                }
                break;
            }

            case HitObjects: {
                // circles:
                // x,y,time,type,hitSounds,hitSamples
                // sliders:
                // x,y,time,type,hitSounds,sliderType|curveX:curveY|...,repeat,pixelLength,edgeHitsound,edgeSets,hitSamples
                // spinners:
                // x,y,time,type,hitSounds,endTime,hitSamples
                std::vector<std::string_view> &csvs = spbuf1;
                SString::split(csvs, curLine, ',');
                if(csvs.size() < 4) break;

                const auto x = Parsing::strto<f32>(csvs[0]);
                const auto y = Parsing::strto<f32>(csvs[1]);
                const auto time = Parsing::strto<i32>(csvs[2]);
                const auto type = Parsing::strto<i32>(csvs[3]);
                if(!x || !y || !time || !type) {
                    debugLog("Invalid hit object: {}", curLine);
                    break;
                }

                const bool newCombo = (*type & PpyHitObjectType::NEW_COMBO) != 0;
                const vec2 xy{std::clamp(*x, -sliderSanityRange, sliderSanityRange),
                              std::clamp(*y, -sliderSanityRange, sliderSanityRange)};

                if(*type & PpyHitObjectType::CIRCLE) {
                    b.hitobjects.push_back(std::make_unique<Circle>(xy, *time, newCombo));
                    b.iNumCircles++;
                } else if(*type & PpyHitObjectType::SLIDER) {
                    if(csvs.size() < 8) {
                        debugLog("Invalid slider (too few fields): {}", curLine);
                        break;
                    }

                    std::vector<std::string_view> &curves = spbuf2;
                    SString::split(curves, csvs[5], '|');

                    const std::string_view curveTypeStr = curves.empty() ? std::string_view{} : SString::trimmed(curves[0]);
                    const SLIDERCURVETYPE curveType =
                        curveTypeStr.empty() ? SliderCurveType::BEZIER : curveTypeStr.front();

                    std::vector<vec2> points;
                    for(uSz i = 1; i < curves.size(); i++) {
                        f32 cpX{}, cpY{};
                        // just skip infinite/invalid curve points
                        if(!Parsing::parse(curves[i], &cpX, ':', &cpY)) continue;

                        points.emplace_back(std::clamp(cpX, -sliderSanityRange, sliderSanityRange),
                                            std::clamp(cpY, -sliderSanityRange, sliderSanityRange));
                    }

                    const auto repeat = Parsing::strto<i32>(csvs[6]);
                    const auto pixelLength = Parsing::strto<f32>(csvs[7]);
                    if(!pixelLength) {
                        debugLog("Invalid slider pixel length: {}", csvs[7]);
                        break;
                    }

                    // older beatmaps store the start point inside the control points
                    if(points.empty() || points[0] != xy) points.insert(points.begin(), xy);

                    // partially allow broken sliders (add second point to make valid)
                    if(points.size() == 1) points.push_back(xy);

                    b.hitobjects.push_back(std::make_unique<Slider>(
                        xy, *time, newCombo, curveType, std::move(points),
                        std::clamp(repeat.value_or(1), 1, sliderMaxRepeatRange),
                        std::clamp(std::abs(*pixelLength), 0.0f, sliderSanityRange)));
                    b.iNumSliders++;
                } else if(*type & PpyHitObjectType::SPINNER) {
                    const auto endTime = csvs.size() > 5 ? Parsing::strto<i32>(csvs[5]) : std::nullopt;
                    if(!endTime) {
                        debugLog("Invalid spinner: {}", curLine);
                        break;
                    }

                    b.hitobjects.push_back(std::make_unique<Spinner>(*time, *endTime, newCombo));
                    b.iNumSpinners++;
                }

                break;
            }
        }
    }

    if(!hasHitObjectsSection) {
        result.error.errc = LoadError::MISSING_SECTION;
        return result;
    }
    if(b.hitobjects.empty()) {
        result.error.errc = LoadError::NO_OBJECTS;
        return result;
    }
    // late bail if too many hitobjects would run out of memory and crash
    if(b.hitobjects.size() > cv::beatmap_max_num_hitobjects.getVal<uSz>()) {
        result.error.errc = LoadError::TOOMANY_HITOBJECTS;
        return result;
    }
    if(b.timingpoints.empty() && b.iNumSliders > 0) {
        result.error.errc = LoadError::NO_TIMINGPOINTS;
        return result;
    }

    // difficulty: AR falls back to OD in old charts
    b.difficulty.AR = approachRate.value_or(b.difficulty.OD);
    b.difficulty.AR = clamp_difficulty(b.difficulty.AR);
    b.difficulty.CS = clamp_difficulty(b.difficulty.CS);
    b.difficulty.OD = clamp_difficulty(b.difficulty.OD);
    b.difficulty.HP = clamp_difficulty(b.difficulty.HP);
    if(!(b.fSliderMultiplier > 0.f)) b.fSliderMultiplier = 1.4f;
    if(!(b.fSliderTickRate > 0.f)) b.fSliderTickRate = 1.f;

    for(const auto &tempCol : tempColors) {
        if(tempCol.has_value()) b.combocolors.push_back(tempCol.value());
    }
    if(b.combocolors.empty()) b.combocolors.assign(DEFAULT_COMBO_COLORS.begin(), DEFAULT_COMBO_COLORS.end());

    // charts are not guaranteed to be sorted
    std::ranges::stable_sort(b.timingpoints, timingPointSortComparator);
    std::ranges::stable_sort(b.hitobjects, {}, [](const auto &obj) { return obj->getTime(); });
    std::ranges::sort(b.breaks, {}, &BREAK::startTime);

    // slider durations
    for(auto &obj : b.hitobjects) {
        if(obj->getType() != HitObjectType::SLIDER) continue;
        auto &slider = static_cast<Slider &>(*obj);

        const TIMING_INFO ti = b.getTimingInfoForTime(slider.getTime());
        const f64 pxPerBeat = (f64)b.fSliderMultiplier * 100.0 * ti.sliderVelocity;
        f64 slideDuration = ((f64)slider.getCurve().getPixelLength() / pxPerBeat) * ti.beatLength;

        // sanity check, also covers zero-length and NaN timing
        if(!std::isfinite(slideDuration) || slideDuration < 1.0) slideDuration = 1.0;

        slider.duration = slideDuration * slider.getRepeats();
    }

    // a long spinner or slider can end after objects that start later
    for(const auto &obj : b.hitobjects) {
        b.fLastObjectEndTime = std::max(b.fLastObjectEndTime, obj->getEndTime());
    }

    // combo numbers and colors
    {
        i32 comboNumber = 1;
        i32 colorIndex = 0;
        const auto numColors = (i32)b.combocolors.size();

        for(uSz i = 0; i < b.hitobjects.size(); i++) {
            HitObject &obj = *b.hitobjects[i];
            if(i == 0) {
                comboNumber = 1;
            } else if(obj.bNewCombo) {
                comboNumber = 1;
                colorIndex = (colorIndex + 1) % numColors;
            }

            obj.iComboNumber = comboNumber++;
            obj.iColorIndex = colorIndex;
            obj.comboColor = b.combocolors[colorIndex];
        }
    }

    if(b.iID > 0) {
        b.sIdentity = fmt::format("{}", b.iID);
    } else {
        b.sIdentity = fmt::format("{:016x}", hash_text(beatmapFile));
    }

    logIfCV(debug_judgement, "parsed \"{}\" [{}]: {} objects, {} timingpoints, {} breaks", b.sTitle,
            b.sDifficultyName, b.hitobjects.size(), b.timingpoints.size(), b.breaks.size());

    result.beatmap = std::move(beatmap);
    return result;
}

Beatmap::TIMING_INFO Beatmap::getTimingInfoForTimeAndTimingPoints(i32 positionMS,
                                                                  const std::vector<TIMINGPOINT> &timingpoints) {
    TIMING_INFO ti{};
    if(timingpoints.empty()) return ti;

    // before any point applies, the first uninherited point governs the beat length
    uSz point = 0;
    for(uSz i = 0; i < timingpoints.size(); i++) {
        if(timingpoints[i].uninherited) {
            point = i;
            break;
        }
    }
    uSz samplePoint = 0;
    uSz latest = 0;
    bool anyUninheritedSeen = false;

    // inherited points don't reset the active beat length
    for(uSz i = 0; i < timingpoints.size(); i++) {
        const auto &tp = timingpoints[i];
        if(tp.offset > positionMS) break;  // sorted by offset

        latest = i;
        if(tp.uninherited) {
            point = i;
            anyUninheritedSeen = true;
        } else {
            samplePoint = i;
        }
    }

    const TIMINGPOINT &beat = timingpoints[point];
    const TIMINGPOINT &velocity = timingpoints[samplePoint];

    ti.offset = beat.offset;
    ti.beatLength = beat.msPerBeat;
    ti.meter = beat.meter;
    ti.kiai = timingpoints[latest].kiai;

    // an inherited point only applies if it comes after the governing uninherited one
    const bool inheritedApplies = !velocity.uninherited && (samplePoint > point || !anyUninheritedSeen) &&
                                  velocity.offset <= positionMS;
    if(inheritedApplies && velocity.msPerBeat < 0) {
        ti.sliderVelocity = std::clamp(100.0 / -velocity.msPerBeat, 0.1, 10.0);
    }

    ti.isNaN = std::isnan(beat.msPerBeat) || std::isnan(velocity.msPerBeat);
    if(ti.isNaN) ti.sliderVelocity = 1.0;

    return ti;
}

i32 Beatmap::getFirstObjectTime() const { return this->hitobjects.empty() ? 0 : this->hitobjects.front()->getTime(); }

bool Beatmap::isInBreak(f64 positionMS) const {
    return std::ranges::any_of(this->breaks, [positionMS](const BREAK &brk) {
        return positionMS >= (f64)brk.startTime && positionMS < (f64)brk.endTime;
    });
}
