// Copyright (c) 2026, hitcore contributors, All rights reserved.
// headless autoplay runner for a single .osu file

#include "AudioSource.h"
#include "Beatmap.h"
#include "ConVar.h"
#include "Console.h"
#include "GameConVars.h"
#include "Logging.h"
#include "ModState.h"
#include "PlaySession.h"
#include "ScoreDatabase.h"
#include "Timing.h"

#include <SDL3/SDL_init.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace {  // static

// stands in for a decoded song: the position simply follows the runner's clock
class WallClockAudioSource final : public AbstractAudioSource {
   public:
    explicit WallClockAudioSource(const f64 *clockMS) : clockMS(clockMS) {}

    void load(std::string_view path, LoadCallback onLoaded) override {
        debugLog("Using wall clock instead of decoding {}", path.empty() ? "(no audio file)" : path);
        onLoaded(true);
    }

    void play(f64 positionMS) override {
        this->fStartPos = positionMS;
        this->fStartClock = *this->clockMS;
        this->bPlaying = true;
    }

    void stop() override {
        this->fStartPos = this->getPositionMS();
        this->bPlaying = false;
    }

    void setRate(f32 rate) override {
        // rebase, so the position doesn't jump
        if(this->bPlaying) this->play(this->getPositionMS());
        this->fRate = rate;
    }

    [[nodiscard]] f64 getPositionMS() const override {
        if(!this->bPlaying) return 0.0;
        return this->fStartPos + (*this->clockMS - this->fStartClock) * this->fRate;
    }

    // unknown, the song never ends on its own
    [[nodiscard]] f64 getDurationMS() const override { return 0.0; }

   private:
    const f64 *clockMS;
    f64 fStartPos{0.0};
    f64 fStartClock{0.0};
    f32 fRate{1.f};
    bool bPlaying{false};
};

constexpr std::string_view usage = "<osu_file> [-mods HDDT] [-exec file.cfg] [-fast] [-log]";

// one simulated frame when running with -fast
constexpr f64 FAST_FRAME_MS = 1000.0 / 240.0;

}  // namespace

int main(int argc, char *argv[]) {
    auto arg_cmdline = std::vector<std::string>(argv, argv + argc);

    // same convention as the client: "-key value" or "-flag", anything else is positional
    auto arg_map = [&]() -> std::unordered_map<std::string, std::optional<std::string>> {
        std::unordered_map<std::string, std::optional<std::string>> args;
        for(int i = 1; i < argc; ++i) {
            std::string_view arg{argv[i]};
            if(arg.starts_with('-'))
                if(i + 1 < argc && !(argv[i + 1][0] == '-')) {
                    args[std::string(arg)] = argv[i + 1];
                    ++i;
                } else
                    args[std::string(arg)] = std::nullopt;
            else
                args[std::string(arg)] = std::nullopt;
        }
        return args;
    }();

    if(arg_cmdline.size() < 2 || arg_cmdline[1].starts_with('-')) {
        logRaw("usage: {} {}", arg_cmdline.empty() ? "hitcore" : arg_cmdline[0], usage);
        return 1;
    }
    const std::string &osuFilePath = arg_cmdline[1];

    // NOLOAD, so only the command line can turn it on
    if(arg_map.contains("-log")) cv::log_to_file.setValue(true);
    Logger::init(cv::log_to_file.getBool());
    atexit(Logger::shutdown);

    if(!SDL_Init(0)) {
        debugLog("Couldn't SDL_Init(): {}", SDL_GetError());
        return 1;
    }

    if(auto it = arg_map.find("-exec"); it != arg_map.end() && it->second.has_value()) {
        if(!Console::execConfigFile(it->second.value())) {
            logRaw("error: could not read config file {}", it->second.value());
            SDL_Quit();
            return 1;
        }
    }

    ModState mods;
    if(auto it = arg_map.find("-mods"); it != arg_map.end() && it->second.has_value()) {
        auto parsed = ModState::fromString(it->second.value());
        if(!parsed.has_value()) {
            logRaw("error: unknown mod string \"{}\"", it->second.value());
            SDL_Quit();
            return 1;
        }
        mods = parsed.value();
    }

    // the runner has no player, everything is scripted
    mods.set(ModFlags::Autoplay, true);

    auto loaded = Beatmap::loadFromFile(osuFilePath);
    if(loaded.error) {
        logRaw("error: could not load {}: {}", osuFilePath, loaded.error.error_string());
        SDL_Quit();
        return 1;
    }

    const auto &beatmap = loaded.beatmap;
    logRaw("{} - {} [{}] by {}, {} objects, +{}", beatmap->getArtist(), beatmap->getTitle(),
           beatmap->getDifficultyName(), beatmap->getCreator(), beatmap->getNumObjects(), mods.toString());

    const bool fast = arg_map.contains("-fast");

    f64 clockMS = 0.0;
    const u64 startTicks = Timing::getTicksNS();
    const auto tickClock = [&]() {
        if(fast)
            clockMS += FAST_FRAME_MS;
        else
            clockMS = (f64)(Timing::getTicksNS() - startTicks) / 1000000.0;
    };

    WallClockAudioSource audio(&clockMS);
    PlaySession session;

    if(!session.start(beatmap, &audio, mods)) {
        logRaw("error: {}", session.getLastLoadError().error_string());
        SDL_Quit();
        return 1;
    }

    // the wall clock source finishes loading synchronously
    if(session.getState() != PlaySession::State::PLAYING) {
        logRaw("error: session did not start, state {}", PlaySession::stateToString(session.getState()));
        SDL_Quit();
        return 1;
    }

    if(session.skip()) {
        logRaw("skipped intro to {:.0f} ms", session.getTime());
    }

    while(session.getState() == PlaySession::State::PLAYING) {
        tickClock();
        session.update(clockMS);
        if(!fast) Timing::sleepMS(1);
    }

    auto result = session.finish();
    if(!result.has_value()) {
        logRaw("error: session ended in state {}", PlaySession::stateToString(session.getState()));
        SDL_Quit();
        return 1;
    }

    logRaw("{}", result->dbgstr());

    if(!session.isSubmittable()) {
        logRaw("protected convars were modified, not recording the score");
        SDL_Quit();
        return result->passed ? 0 : 2;
    }

    ScoreDatabase db;
    db.load();
    if(db.addScore(result.value())) {
        logRaw("new best for +{}", result->mods.toString());
        if(!db.save()) logRaw("warning: could not save {}", cv::score_db_path.getString());
    }

    SDL_Quit();
    return result->passed ? 0 : 2;
}
