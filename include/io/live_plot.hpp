#pragma once
/*
GnuplotLive - minimal pipe wrapper for the coverage-by-degree chart.

- plot_band(...) draws mean +/- sd as a filled band plus the mean line in a
  SINGLE plot command, so the two never show up as alternating frames.
- Every data block ('-') promised in the header is sent; any write failure
  disables plotting. A missing gnuplot binary just leaves valid() false.
*/

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

class GnuplotLive {
public:
    explicit GnuplotLive(const std::string& title) {
#if defined(_WIN32)
        gp_ = _popen("gnuplot -persist", "w");
#else
        gp_ = popen("gnuplot -persist", "w");
#endif
        if (!gp_) { valid_ = false; return; }
        valid_ = true;
        cmd(std::string("set title '") + escape_(title) + "'");
        cmd("set grid");
    }

    ~GnuplotLive() {
        if (gp_) {
#if defined(_WIN32)
            _pclose(gp_);
#else
            pclose(gp_);
#endif
            gp_ = nullptr;
        }
    }

    GnuplotLive(const GnuplotLive&) = delete;
    GnuplotLive& operator=(const GnuplotLive&) = delete;

    bool valid() const { return valid_; }

    void cmd(const std::string& s) {
        if (!valid_) return;
        std::string line = s;
        if (!line.empty() && line.back() != '\n') line.push_back('\n');
        if (std::fputs(line.c_str(), gp_) < 0) { disable_(); return; }
        if (std::fflush(gp_) != 0) { disable_(); return; }
    }

    void set_xrange(double a, double b) { cmd("set xrange [" + to_str_(a) + ":" + to_str_(b) + "]"); }
    void set_yrange(double a, double b) { cmd("set yrange [" + to_str_(a) + ":" + to_str_(b) + "]"); }

    // Mean line over a [lo, hi] band, both in one frame.
    void plot_band(const std::vector<double>& x,
                   const std::vector<double>& mean,
                   const std::vector<double>& lo,
                   const std::vector<double>& hi,
                   const std::string& band_title,
                   const std::string& line_title) {
        if (!valid_) return;
        const std::size_t n = std::min({x.size(), mean.size(), lo.size(), hi.size()});
        if (n == 0) return;

        if (std::fprintf(gp_,
            "plot '-' with filledcurves fs transparent solid 0.25 noborder title '%s', "
            "'-' with linespoints lw 2 pt 7 title '%s'\n",
            escape_(band_title).c_str(), escape_(line_title).c_str()) < 0) { disable_(); return; }

        for (std::size_t i = 0; i < n; ++i) {
            if (std::fprintf(gp_, "%.*g %.*g %.*g\n", 16, x[i], 16, lo[i], 16, hi[i]) < 0) { disable_(); return; }
        }
        if (std::fputs("e\n", gp_) < 0) { disable_(); return; }

        for (std::size_t i = 0; i < n; ++i) {
            if (std::fprintf(gp_, "%.*g %.*g\n", 16, x[i], 16, mean[i]) < 0) { disable_(); return; }
        }
        if (std::fputs("e\n", gp_) < 0) { disable_(); return; }
        if (std::fflush(gp_) != 0) { disable_(); return; }
    }

private:
    static std::string escape_(const std::string& s) {
        std::string t; t.reserve(s.size()*2);
        for (char c: s) { if (c=='\'' || c=='\\') t.push_back('\\'); t.push_back(c); }
        return t;
    }
    static std::string to_str_(double v) {
        std::ostringstream oss; oss.precision(16); oss << v; return oss.str();
    }
    void disable_() { valid_ = false; }

    FILE* gp_{nullptr};
    bool valid_{false};
};
