#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace tally {

// Full-screen clock shown while an interval runs. run() blocks in a Qt event
// loop until SIGINT, SIGTERM or SIGHUP arrives and returns that signal.
class ClockDisplay {
public:
    ClockDisplay(std::string project, TimePoint start, std::ostream &out);

    int run();

    // Draws one frame for the given wall-clock instant.
    void drawFrame(TimePoint now);

    // Five text rows spelling "HH:MM:SS" in large glyphs.
    static std::vector<std::string> renderBigText(const QString &text);

    static QString signalLabel(int signalNumber);

private:
    std::string m_project;
    TimePoint m_start;
    std::ostream &m_out;
};

} // namespace tally
