#include "Logging.hpp"

#include "core/game.hpp"
#include "core/notation.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

namespace tessera::cli {

static char playerName(const Player player) {
	return player == Player::Black ? 'B' : 'W';
}

//! One character per cell. Lower case: held by the placing player. Upper case: captured by the other one.
static char cellSymbol(const Tile tile) {
	if (isEmpty(tile)) {
		return '.';
	}
	const char symbol = owner(tile) == Player::Black ? 'b' : 'w';
	return owner(tile) == controller(tile) ? symbol : static_cast<char>(symbol - 'a' + 'A');
}

static void drawBoard(const Game& game) {
	const auto& board = game.position().board;
	const int radius  = static_cast<int>(board.radius());

	std::cout << "\n";
	for (int r = -radius; r <= radius; ++r) {
		std::cout << std::format("{:>3} ", r) << std::string(static_cast<std::size_t>(std::abs(r)), ' ');
		for (int q = -radius; q <= radius; ++q) {
			const Coord c{q, r};
			if (board.contains(c)) {
				std::cout << cellSymbol(board.get(c)) << ' ';
			}
		}
		std::cout << "\n";
	}
	std::cout << std::format("\nBlack {} - White {}\n", game.score(Player::Black), game.score(Player::White));
}

//! Prints what changed after every accepted action.
class DeltaPrinter : public IGameListener {
public:
	void onGameDelta(const GameDelta& delta) override {
		switch (delta.action) {
		case GameAction::Place:
			std::cout << std::format("{} played {}", playerName(delta.player), toNotation(*delta.move));
			if (!delta.flipped.empty()) {
				std::cout << std::format(", {} tiles flipped", delta.flipped.size());
			}
			std::cout << "\n";
			break;
		case GameAction::Pass:
			std::cout << std::format("{} passed\n", playerName(delta.player));
			break;
		case GameAction::Resign:
			std::cout << std::format("{} resigned\n", playerName(delta.player));
			break;
		}
	}
};

static unsigned parseRadius(int argc, char** argv) {
	if (argc < 2) {
		return kDefaultBoardRadius;
	}

	const std::string arg{argv[1]};
	unsigned radius = 0u;
	const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), radius);
	if (ec != std::errc{} || ptr != arg.data() + arg.size() || radius == 0u) {
		std::cerr << std::format("Invalid board radius '{}'. Using {}.\n", arg, kDefaultBoardRadius);
		return kDefaultBoardRadius;
	}
	return radius;
}

static int run(int argc, char** argv) {
	const auto radius = parseRadius(argc, argv);
	Logger().Log(Logging::LogLevel::Info, std::format("[Cli] Starting game on board radius {}.", radius));

	Game game{GameConfig{.boardRadius = radius}};
	DeltaPrinter printer;
	game.subscribe(&printer);

	std::string line;
	while (game.isActive()) {
		drawBoard(game);
		const auto player = game.currentPlayer();
		std::cout << std::format("{} to move ({} legal moves): ", playerName(player), game.legalMoves().size());

		if (!std::getline(std::cin, line) || line == "quit" || line == "exit") {
			break;
		}

		if (line == "pass") {
			if (!game.pass(player)) {
				std::cout << "Pass declined.\n";
			}
		} else if (line == "resign") {
			if (!game.resign(player)) {
				std::cout << "Resign declined.\n";
			}
		} else if (line == "moves") {
			for (const auto& move: game.legalMoves()) {
				std::cout << toNotation(move) << "\n";
			}
		} else if (const auto move = fromNotation(line, player)) {
			if (!game.putTile(player, *move)) {
				std::cout << "Move declined.\n";
			}
		} else {
			std::cout << "Expected 'q,r:pattern', 'pass', 'moves', 'resign' or 'quit'.\n";
		}
	}

	game.unsubscribe(&printer);
	drawBoard(game);

	if (!game.isActive()) {
		const auto winner = game.winner();
		std::cout << (winner ? std::format("{} wins.\n", playerName(*winner)) : std::string{"Draw.\n"});
	}

	Logger().Flush();
	return 0;
}

} // namespace tessera::cli

int main(int argc, char** argv) {
	return tessera::cli::run(argc, argv);
}
