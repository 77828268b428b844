#include "Interface.hpp"
#include "imgui.h"
#include "imgui-SFML.h"
#include <SFML/Graphics.hpp>
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <algorithm>
#include <cstdlib>

#include "Pieces.hpp"

const int TILE_SIZE = 75;
const int BOARD_PADDING = 30;
const int PANEL_WIDTH = 320;
const int BOARD_PIXEL_SIZE = 8 * TILE_SIZE;
const int OFFSET_X = BOARD_PADDING;
const int OFFSET_Y = BOARD_PADDING;
const int WIN_WIDTH = BOARD_PIXEL_SIZE + (2 * BOARD_PADDING) + PANEL_WIDTH;
const int WIN_HEIGHT = BOARD_PIXEL_SIZE + (2 * BOARD_PADDING);

// Overlay order, left to right
const PieceType PROMOTION_CHOICES[4] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight};

// +1..+6 White Pawn..King, negative for Black
int piece_id(const SquareView& view) {
    int id = static_cast<int>(view.type) + 1;
    return view.colour == Colour::White ? id : -id;
}

struct Assets {
    sf::Font font;
    std::map<int, sf::Texture> textures;
    bool has_font = false;
    void load() {
        if (font.loadFromFile("assets/font.TTF")) has_font = true;
        auto load_piece = [&](int id, std::string filename) {
            sf::Texture tex;
            if (tex.loadFromFile("assets/" + filename)) {
                tex.setSmooth(true); textures[id] = tex;
            }
        };
        load_piece(1, "Chess_plt45.png"); load_piece(2, "Chess_nlt45.png");
        load_piece(3, "Chess_blt45.png"); load_piece(4, "Chess_rlt45.png");
        load_piece(5, "Chess_qlt45.png"); load_piece(6, "Chess_klt45.png");
        load_piece(-1, "Chess_pdt45.png"); load_piece(-2, "Chess_ndt45.png");
        load_piece(-3, "Chess_bdt45.png"); load_piece(-4, "Chess_rdt45.png");
        load_piece(-5, "Chess_qdt45.png"); load_piece(-6, "Chess_kdt45.png");
    }
};

std::optional<Location> get_square_at(int mouse_x, int mouse_y, bool flipped) {
    int x = mouse_x - OFFSET_X;
    int y = mouse_y - OFFSET_Y;
    if (x < 0 || x >= BOARD_PIXEL_SIZE || y < 0 || y >= BOARD_PIXEL_SIZE) return std::nullopt;
    int col = x / TILE_SIZE; int row = y / TILE_SIZE;
    int file = flipped ? (7 - col) : col;
    int rank = flipped ? row : (7 - row);
    return Location::from_coords(file, rank);
}

// Field `index` of a FEN string (0 = placement)
std::string fen_field(const std::string& fen, int index) {
    std::istringstream ss(fen);
    std::string field;
    for (int i = 0; i <= index; ++i) {
        if (!(ss >> field)) return "-";
    }
    return field;
}

namespace GUI {
    void Launch(IChessCore& core, std::string start_fen) {
        sf::RenderWindow window(sf::VideoMode(WIN_WIDTH, WIN_HEIGHT), "Chess");
        window.setFramerateLimit(60);
        ImGui::SFML::Init(window);

        Assets assets; assets.load();
        std::optional<Location> selected_sq;
        std::vector<Location> destinations;
        sf::Clock deltaClock;

        bool is_promoting = false;
        std::optional<Location> promo_from;
        std::optional<Location> promo_to;
        bool view_flipped = false;
        std::string last_error;
        char san_buffer[32] = "";

        auto clear_selection = [&]() {
            selected_sq.reset(); destinations.clear();
            is_promoting = false; promo_from.reset(); promo_to.reset();
        };

        auto report = [&](const Result<MoveRecord>& result) {
            if (result) last_error.clear();
            else last_error = result.error().describe();
        };

        auto reset_game = [&]() {
            if (start_fen.empty()) {
                core.reset();
                last_error.clear();
            } else {
                Status loaded = core.load_fen(start_fen);
                if (loaded) last_error.clear();
                else last_error = loaded.error().describe();
            }
            clear_selection();
        };

        auto tile_origin = [&](int file, int rank) {
            float x = view_flipped ? OFFSET_X + (7 - file) * TILE_SIZE : OFFSET_X + file * TILE_SIZE;
            float y = view_flipped ? OFFSET_Y + rank * TILE_SIZE : OFFSET_Y + (7 - rank) * TILE_SIZE;
            return sf::Vector2f(x, y);
        };

        // Texture if the asset loaded, otherwise a disc with the piece letter
        auto draw_piece = [&](int id, sf::Vector2f centre, float size) {
            if (assets.textures.count(id)) {
                sf::Sprite s(assets.textures[id]);
                float sc = size / s.getLocalBounds().width;
                s.setScale(sc, sc); s.setOrigin(s.getLocalBounds().width/2, s.getLocalBounds().height/2);
                s.setPosition(centre); window.draw(s);
                return;
            }
            bool white = id > 0;
            sf::CircleShape disc(size * 0.4f);
            disc.setOrigin(size * 0.4f, size * 0.4f);
            disc.setFillColor(white ? sf::Color(250, 250, 250) : sf::Color(30, 30, 30));
            disc.setOutlineThickness(2.f);
            disc.setOutlineColor(white ? sf::Color(30, 30, 30) : sf::Color(250, 250, 250));
            disc.setPosition(centre); window.draw(disc);
            if (assets.has_font) {
                sf::Text letter(std::string(1, piece_letter(static_cast<PieceType>(std::abs(id) - 1))),
                                assets.font, static_cast<unsigned>(size * 0.45f));
                letter.setFillColor(white ? sf::Color(30, 30, 30) : sf::Color(250, 250, 250));
                sf::FloatRect bounds = letter.getLocalBounds();
                letter.setOrigin(bounds.left + bounds.width/2, bounds.top + bounds.height/2);
                letter.setPosition(centre); window.draw(letter);
            }
        };

        auto render_board = [&](const OccupancyGrid& grid) {
            // Draw Background
            sf::RectangleShape tile(sf::Vector2f(TILE_SIZE, TILE_SIZE));
            for (int r = 0; r < 8; ++r) {
                for (int f = 0; f < 8; ++f) {
                    bool is_light = ((r + f) % 2 != 0);
                    tile.setFillColor(is_light ? sf::Color(240, 217, 181) : sf::Color(181, 136, 99));
                    tile.setPosition(tile_origin(f, r)); window.draw(tile);
                }
            }
            // Draw Highlights
            auto draw_hl = [&](Location sq, sf::Color c) {
                tile.setPosition(tile_origin(sq.file(), sq.rank())); tile.setFillColor(c); window.draw(tile);
            };
            if (!is_promoting && selected_sq) {
                draw_hl(*selected_sq, sf::Color(255, 255, 0, 100));
                for (const auto& dest : destinations) draw_hl(dest, sf::Color(100, 255, 100, 100));
            }
            // Draw Pieces
            for (int r = 0; r < 8; ++r) {
                for (int f = 0; f < 8; ++f) {
                    const auto& cell = grid[r][f];
                    if (!cell) continue;
                    if (is_promoting && promo_from && promo_from->file() == f && promo_from->rank() == r) continue;
                    sf::Vector2f centre = tile_origin(f, r) + sf::Vector2f(TILE_SIZE/2.0f, TILE_SIZE/2.0f);
                    draw_piece(piece_id(*cell), centre, TILE_SIZE * 0.85f);
                }
            }
            // Draw Promotion UI
            if (is_promoting) {
                sf::RectangleShape ov(sf::Vector2f(WIN_WIDTH, WIN_HEIGHT)); ov.setFillColor(sf::Color(0,0,0,150)); window.draw(ov);
                float cx = (WIN_WIDTH - PANEL_WIDTH)/2.0f, cy = WIN_HEIGHT/2.0f;
                for (int i = 0; i < 4; ++i) {
                    SquareView view{PROMOTION_CHOICES[i], core.active_player()};
                    draw_piece(piece_id(view), sf::Vector2f(cx + (i-1.5f)*(TILE_SIZE*1.5f), cy), TILE_SIZE*1.2f);
                }
            }
        };

        auto handle_click = [&](int mx, int my, const OccupancyGrid& grid) {
            if (is_promoting) {
                float cx = (WIN_WIDTH - PANEL_WIDTH)/2.0f; float cy = WIN_HEIGHT/2.0f; float btn = TILE_SIZE*1.5f;
                int idx = -1;
                for (int i = 0; i < 4; ++i) {
                    float bx = cx + (i-1.5f)*btn;
                    if (mx > bx-btn/2 && mx < bx+btn/2 && my > cy-btn/2 && my < cy+btn/2) { idx = i; break; }
                }
                if (idx == -1) { clear_selection(); return; }
                report(core.move(*promo_from, *promo_to, PROMOTION_CHOICES[idx]));
                clear_selection();
                return;
            }

            auto clicked = get_square_at(mx, my, view_flipped);
            if (!clicked) return;

            if (selected_sq && std::find(destinations.begin(), destinations.end(), *clicked) != destinations.end()) {
                const auto& mover = grid[selected_sq->rank()][selected_sq->file()];
                int last_rank = core.active_player() == Colour::White ? 7 : 0;
                if (mover && mover->type == PieceType::Pawn && clicked->rank() == last_rank) {
                    is_promoting = true; promo_from = selected_sq; promo_to = clicked;
                    return;
                }
                report(core.move(*selected_sq, *clicked, std::nullopt));
                clear_selection();
                return;
            }

            const auto& cell = grid[clicked->rank()][clicked->file()];
            if (cell && cell->colour == core.active_player()) {
                selected_sq = clicked;
                destinations = core.legal_destinations(*clicked);
            } else {
                clear_selection();
            }
        };

        while (window.isOpen()) {
            const OccupancyGrid grid = core.grid();

            sf::Event event;
            while (window.pollEvent(event)) {
                ImGui::SFML::ProcessEvent(window, event);
                if (event.type == sf::Event::Closed) window.close();

                if (event.type == sf::Event::MouseButtonPressed && event.mouseButton.button == sf::Mouse::Left) {
                    if (ImGui::GetIO().WantCaptureMouse) continue;
                    handle_click(event.mouseButton.x, event.mouseButton.y, grid);
                }
            }

            ImGui::SFML::Update(window, deltaClock.restart());

            const std::string fen = core.to_fen();
            const auto& moves = core.moves();
            const bool checkmate = !moves.empty() && moves.back().checkmate;
            const Colour to_move = core.active_player();

            // --- SIDEBAR UI ---
            ImGui::SetNextWindowPos(sf::Vector2f(WIN_WIDTH - PANEL_WIDTH, 0));
            ImGui::SetNextWindowSize(sf::Vector2f(PANEL_WIDTH, WIN_HEIGHT));
            ImGui::Begin("Controls", nullptr, ImGuiWindowFlags_NoDecoration);

            if (checkmate) {
                ImGui::TextColored(ImVec4(1, 0, 0, 1), "CHECKMATE");
                ImGui::TextColored(ImVec4(0, 1, 0, 1), "%s King has no escape", colour_name(to_move));
                ImGui::Separator();
            }

            ImGui::TextColored(ImVec4(1,1,0,1), "GAME STATUS");
            ImGui::Separator();
            ImGui::Text("Turn: %s", colour_name(to_move));
            ImGui::Text("Move #: %s", fen_field(fen, 5).c_str());
            ImGui::Text("Castling: %s", fen_field(fen, 2).c_str());
            ImGui::Text("Check: %s", core.is_in_check(to_move) ? "yes" : "no");
            ImGui::TextWrapped("FEN: %s", fen.c_str());

            if (!last_error.empty()) {
                ImGui::Spacing();
                ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "LAST ERROR");
                ImGui::Separator();
                ImGui::TextWrapped("%s", last_error.c_str());
            }

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,1,1), "PLAY");
            ImGui::Separator();
            bool submit = ImGui::InputText("##san", san_buffer, sizeof(san_buffer), ImGuiInputTextFlags_EnterReturnsTrue);
            ImGui::SameLine();
            if (ImGui::Button("Play") || submit) {
                if (san_buffer[0] != '\0') {
                    report(core.play(san_buffer));
                    san_buffer[0] = '\0';
                    clear_selection();
                }
            }
            ImGui::Checkbox("Flip Board", &view_flipped);
            if (ImGui::Button("Reset Game", ImVec2(100, 30))) reset_game();

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,0,1), "CAPTURED");
            ImGui::Separator();
            std::string by_white, by_black;
            for (const auto& record : moves) {
                if (!record.captured) continue;
                std::string& list = record.colour == Colour::White ? by_white : by_black;
                list += piece_letter(*record.captured);
                list += ' ';
            }
            ImGui::Text("By White: %s", by_white.c_str());
            ImGui::Text("By Black: %s", by_black.c_str());

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,0,1), "MOVES");
            ImGui::Separator();
            ImGui::BeginChild("move_log", ImVec2(0, 0), true);
            for (std::size_t i = 0; i < moves.size(); i += 2) {
                std::string row = std::to_string(i / 2 + 1) + ". " + moves[i].notation;
                if (i + 1 < moves.size()) row += "   " + moves[i + 1].notation;
                ImGui::TextUnformatted(row.c_str());
            }
            ImGui::EndChild();

            ImGui::End();

            window.clear(sf::Color(30, 30, 30));
            render_board(core.grid());
            ImGui::SFML::Render(window);
            window.display();
        }

        ImGui::SFML::Shutdown();
    }
}
