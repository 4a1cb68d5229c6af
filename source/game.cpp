// Snake front end using Notcurses for rendering and input
#include "game.h"
#include "log.h"
#include <algorithm>
#include <chrono>
#include <clocale>
#include <cmath>
#include <cstdint>
#include <string>
#include <thread>

#include <notcurses/notcurses.h>

namespace
{
    // Keep Notcurses handles accessible to const render functions
    notcurses *g_nc = nullptr;
    ncplane *g_stdp = nullptr;
    inline void set_fg(ncplane *n, uint8_t r, uint8_t g, uint8_t b) { ncplane_set_fg_rgb8(n, r, g, b); }

    constexpr int HUDW = 24; // fixed side panel width
}

// ----------------------
// Game lifecycle
// ----------------------
Game::Game(const Config &cfg, unsigned seed)
    : cfg(cfg), data(cfg, seed),
      width(static_cast<int>(std::ceil(cfg.fieldWidth)) + 2),
      height(static_cast<int>(std::ceil(cfg.fieldHeight)) + 2)
{
}

int Game::run()
{
    setlocale(LC_ALL, "");
    notcurses_options opts{};
    opts.loglevel = NCLOGLEVEL_SILENT;
    struct notcurses *nc = notcurses_init(&opts, nullptr);
    if (!nc)
    {
        LOG_ERROR("notcurses_init failed");
        return 1;
    }
    ncplane *stdp = notcurses_stdplane(nc);
    g_nc = nc;
    g_stdp = stdp;

    // Make sure our target area fits in the terminal
    unsigned termh = 0, termw = 0;
    ncplane_dim_yx(stdp, &termh, &termw);
    if (static_cast<unsigned>(height) > termh || static_cast<unsigned>(width + HUDW + 1) > termw)
    {
        LOG_ERROR("terminal " << termw << "x" << termh << " too small for board " << width << "x" << height);
        ncplane_putstr_yx(stdp, 0, 0, "Terminal too small for configured game size.");
        ncplane_putstr_yx(stdp, 1, 0, "Resize terminal or adjust field.width/field.height.");
        notcurses_render(nc);
        std::this_thread::sleep_for(std::chrono::seconds(2));
        notcurses_stop(nc);
        g_nc = nullptr;
        g_stdp = nullptr;
        return 1;
    }

    LOG_INFO("board " << width << "x" << height << ", speed " << cfg.speed);
    auto last = std::chrono::steady_clock::now();

    while (!exitRequested)
    {
        processInput();

        auto now = std::chrono::steady_clock::now();
        float dt = std::chrono::duration<float>(now - last).count();
        last = now;
        if (!paused)
        {
            data.update(dt);
        }

        render();
        notcurses_render(nc);

        // Small sleep to avoid busy loop
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.frameMs));
    }

    LOG_INFO("quit, high score " << data.highScore());
    notcurses_stop(nc);
    g_nc = nullptr;
    g_stdp = nullptr;
    return 0;
}

void Game::processInput()
{
    if (!g_nc)
        return;
    ncinput ni{};
    // Drain all pending inputs non-blocking
    while (true)
    {
        uint32_t key = notcurses_get_nblock(g_nc, &ni);
        if (key == 0u)
            break; // no input available
        if (key == (uint32_t)-1)
            break; // error
        if (ni.evtype == NCTYPE_RELEASE)
            continue;

        // If the pause dialog is open, navigate/select options
        if (dialogType != DialogType::None)
        {
            const int options = 3;
            if (key == NCKEY_UP || key == NCKEY_LEFT)
            {
                dialogIndex = (dialogIndex - 1 + options) % options;
            }
            else if (key == NCKEY_DOWN || key == NCKEY_RIGHT)
            {
                dialogIndex = (dialogIndex + 1) % options;
            }
            else if (key == 'q' || key == 'Q')
            {
                exitRequested = true;
            }
            else if (key == 'p' || key == 'P')
            {
                closeDialog();
            }
            else if (key == ' ' || key == '\n' || key == NCKEY_ENTER)
            {
                if (dialogIndex == 0)
                {
                    closeDialog();
                }
                else if (dialogIndex == 1)
                {
                    LOG_INFO("restart requested");
                    data.reset();
                    closeDialog();
                }
                else
                {
                    exitRequested = true;
                }
            }
            // ignore other keys while dialog is open
            continue;
        }

        if (key == NCKEY_UP || key == 'w' || key == 'W')
        {
            data.pushInput(Direction::Up);
        }
        else if (key == NCKEY_DOWN || key == 's' || key == 'S')
        {
            data.pushInput(Direction::Down);
        }
        else if (key == NCKEY_LEFT || key == 'a' || key == 'A')
        {
            data.pushInput(Direction::Left);
        }
        else if (key == NCKEY_RIGHT || key == 'd' || key == 'D')
        {
            data.pushInput(Direction::Right);
        }
        else if (key == 'q' || key == 'Q')
        {
            exitRequested = true;
        }
        else if (key == ' ' || key == 'p' || key == 'P')
        {
            openDialog(DialogType::Pause);
        }
    }
}

void Game::render() const
{
    if (!g_stdp)
        return;
    ncplane_erase(g_stdp);
    // Compute centered origin for board and HUD
    unsigned ph = 0, pw = 0;
    ncplane_dim_yx(g_stdp, &ph, &pw);
    int oy = (int)ph / 2 - height / 2;
    if (oy < 0)
        oy = 0;
    int ox = (int)pw / 2 - (width + HUDW + 1) / 2;
    if (ox < 0)
        ox = 0;

    renderField(oy, ox);
    renderHud(oy, ox + width + 1);
    if (dialogType != DialogType::None)
        renderDialog(oy, ox);
}

void Game::renderField(int oy, int ox) const
{
    // Border with a gradient from bluish to aqua
    auto grad = [&](float t, uint8_t &r, uint8_t &g, uint8_t &b)
    {
        int r1 = 120, g1 = 160, b1 = 255, r2 = 120, g2 = 255, b2 = 200;
        r = (uint8_t)(r1 + (r2 - r1) * t);
        g = (uint8_t)(g1 + (g2 - g1) * t);
        b = (uint8_t)(b1 + (b2 - b1) * t);
    };
    uint8_t cr, cg, cb;
    for (int x = 0; x < width; ++x)
    {
        grad((float)x / (float)(width - 1), cr, cg, cb);
        set_fg(g_stdp, cr, cg, cb);
        const char *top = (x == 0) ? "╔" : (x == width - 1 ? "╗" : "═");
        const char *bottom = (x == 0) ? "╚" : (x == width - 1 ? "╝" : "═");
        ncplane_putstr_yx(g_stdp, oy, ox + x, top);
        ncplane_putstr_yx(g_stdp, oy + height - 1, ox + x, bottom);
    }
    for (int y = 1; y < height - 1; ++y)
    {
        float t = (float)y / (float)(height - 1);
        grad(t, cr, cg, cb);
        set_fg(g_stdp, cr, cg, cb);
        ncplane_putstr_yx(g_stdp, oy + y, ox, "║");
        grad(1.0f - t, cr, cg, cb);
        set_fg(g_stdp, cr, cg, cb);
        ncplane_putstr_yx(g_stdp, oy + y, ox + width - 1, "║");
    }

    // Field cell (cx, cy) sits at screen (oy + 1 + cy, ox + 1 + cx)
    const int cols = width - 2;
    const int rows = height - 2;
    auto fill = [&](const Rect &box, const char *glyph)
    {
        int x0 = std::max(0, (int)std::floor(box.left()));
        int x1 = std::min(cols, (int)std::ceil(box.right()));
        int y0 = std::max(0, (int)std::floor(box.top()));
        int y1 = std::min(rows, (int)std::ceil(box.bottom()));
        for (int y = y0; y < y1; ++y)
            for (int x = x0; x < x1; ++x)
                ncplane_putstr_yx(g_stdp, oy + 1 + y, ox + 1 + x, glyph);
    };

    set_fg(g_stdp, 255, 80, 80);
    fill(data.food().bbox(), "●");

    // Snake: yellow body, lime head drawn last so it stays on top
    const Snake &snake = data.snake();
    const auto &segs = snake.segments();
    set_fg(g_stdp, 255, 220, 0);
    for (size_t i = 0; i + 1 < segs.size(); ++i)
        fill(segs[i].bbox(snake.width()), "█");
    set_fg(g_stdp, 80, 255, 120);
    fill(segs.back().bbox(snake.width()), "█");

    if (data.state() == GameState::PreGame)
    {
        const std::string hint = "Press an arrow key to start";
        int tx = ox + std::max(1, (width - (int)hint.size()) / 2);
        set_fg(g_stdp, 255, 255, 255);
        ncplane_putstr_yx(g_stdp, oy + height / 2 - 2, tx, hint.c_str());
    }
}

void Game::renderHud(int oy, int hx) const
{
    set_fg(g_stdp, 200, 230, 255);
    ncplane_putstr_yx(g_stdp, oy + 0, hx + 0, "┌");
    for (int x = 1; x < HUDW - 1; ++x)
        ncplane_putstr_yx(g_stdp, oy + 0, hx + x, "─");
    ncplane_putstr_yx(g_stdp, oy + 0, hx + HUDW - 1, "┐");
    for (int y = 1; y < height - 1; ++y)
    {
        ncplane_putstr_yx(g_stdp, oy + y, hx + 0, "│");
        ncplane_putstr_yx(g_stdp, oy + y, hx + HUDW - 1, "│");
    }
    ncplane_putstr_yx(g_stdp, oy + height - 1, hx + 0, "└");
    for (int x = 1; x < HUDW - 1; ++x)
        ncplane_putstr_yx(g_stdp, oy + height - 1, hx + x, "─");
    ncplane_putstr_yx(g_stdp, oy + height - 1, hx + HUDW - 1, "┘");

    set_fg(g_stdp, 255, 215, 0);
    ncplane_putstr_yx(g_stdp, oy + 1, hx + 2, "Score:");
    set_fg(g_stdp, 255, 255, 255);
    ncplane_putstr_yx(g_stdp, oy + 1, hx + 10, std::to_string(data.score()).c_str());
    set_fg(g_stdp, 0, 255, 180);
    ncplane_putstr_yx(g_stdp, oy + 3, hx + 2, "High:");
    set_fg(g_stdp, 255, 255, 255);
    ncplane_putstr_yx(g_stdp, oy + 3, hx + 10, std::to_string(data.highScore()).c_str());
    set_fg(g_stdp, 120, 200, 255);
    ncplane_putstr_yx(g_stdp, oy + 5, hx + 2, "Length:");
    set_fg(g_stdp, 255, 255, 255);
    ncplane_putstr_yx(g_stdp, oy + 5, hx + 10, std::to_string((int)data.snake().length()).c_str());
    set_fg(g_stdp, 200, 200, 200);
    ncplane_putstr_yx(g_stdp, oy + 7, hx + 2, "Controls:");
    set_fg(g_stdp, 180, 180, 180);
    ncplane_putstr_yx(g_stdp, oy + 8, hx + 2, "Arrows/WASD move");
    ncplane_putstr_yx(g_stdp, oy + 9, hx + 2, "p/space pause");
    ncplane_putstr_yx(g_stdp, oy + 10, hx + 2, "q quit");
}

void Game::renderDialog(int oy, int ox) const
{
    int drows = 7;
    int dcols = 32;
    int dy = std::max(1, oy + height / 2 - drows / 2);
    int dx = std::max(1, ox + width / 2 - dcols / 2);
    set_fg(g_stdp, 255, 255, 255);
    ncplane_putstr_yx(g_stdp, dy + 0, dx + 0, "╔");
    for (int x = 1; x < dcols - 1; ++x)
        ncplane_putstr_yx(g_stdp, dy + 0, dx + x, "═");
    ncplane_putstr_yx(g_stdp, dy + 0, dx + dcols - 1, "╗");
    for (int y = 1; y < drows - 1; ++y)
    {
        ncplane_putstr_yx(g_stdp, dy + y, dx + 0, "║");
        for (int x = 1; x < dcols - 1; ++x)
            ncplane_putstr_yx(g_stdp, dy + y, dx + x, " ");
        ncplane_putstr_yx(g_stdp, dy + y, dx + dcols - 1, "║");
    }
    ncplane_putstr_yx(g_stdp, dy + drows - 1, dx + 0, "╚");
    for (int x = 1; x < dcols - 1; ++x)
        ncplane_putstr_yx(g_stdp, dy + drows - 1, dx + x, "═");
    ncplane_putstr_yx(g_stdp, dy + drows - 1, dx + dcols - 1, "╝");

    const std::string title = "Pause";
    set_fg(g_stdp, 120, 200, 255);
    ncplane_putstr_yx(g_stdp, dy + 1, dx + (dcols - (int)title.size()) / 2, title.c_str());

    auto draw_option = [&](int row, int idx, const char *label)
    {
        bool sel = (dialogIndex == idx);
        if (sel)
            set_fg(g_stdp, 255, 255, 255);
        else
            set_fg(g_stdp, 180, 180, 180);
        std::string line = sel ? (std::string("▶ ") + label + " ◀") : (std::string("  ") + label);
        ncplane_putstr_yx(g_stdp, dy + row, dx + 3, line.c_str());
    };
    draw_option(3, 0, "Resume");
    draw_option(4, 1, "Restart");
    draw_option(5, 2, "Quit");
}

void Game::openDialog(DialogType t)
{
    dialogType = t;
    dialogIndex = 0;
    paused = true;
    LOG_INFO("paused");
}

void Game::closeDialog()
{
    dialogType = DialogType::None;
    dialogIndex = 0;
    paused = false;
}
