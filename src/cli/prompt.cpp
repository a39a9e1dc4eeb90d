#include "cli/prompt.hpp"

#include <unistd.h>

namespace dropline::cli {

std::optional<bool> parse_yes_no(const QString& text) {
    const auto word = text.trimmed().toLower();
    if (word == QStringLiteral("y") || word == QStringLiteral("yes")) {
        return true;
    }
    if (word == QStringLiteral("n") || word == QStringLiteral("no")) {
        return false;
    }
    return std::nullopt;
}

std::optional<size_t> parse_choice(const QString& text, size_t count) {
    bool ok = false;
    const auto number = text.trimmed().toULongLong(&ok);
    if (!ok || number == 0 || number > count) {
        return std::nullopt;
    }
    return static_cast<size_t>(number - 1);
}

Prompt::Prompt(QTextStream& out, QObject* parent)
    : QObject(parent)
    , out_(out)
    , notifier_(std::make_unique<QSocketNotifier>(STDIN_FILENO, QSocketNotifier::Read)) {
    notifier_->setEnabled(false);
    connect(notifier_.get(), &QSocketNotifier::activated, this, &Prompt::onReadable);
}

Prompt::~Prompt() = default;

void Prompt::ask(const QString& question, std::function<void(bool)> answer) {
    if (eof_) {
        answer(false);
        return;
    }
    post(Question{
        question,
        QStringLiteral("[y/n]"),
        [answer](const QString& line) {
            const auto verdict = parse_yes_no(line);
            if (!verdict) return false;
            answer(*verdict);
            return true;
        },
        [answer]() { answer(false); },
    });
}

void Prompt::askChoice(const QString& question, size_t count,
                       std::function<void(std::optional<size_t>)> answer) {
    if (eof_ || count == 0) {
        answer(std::nullopt);
        return;
    }
    post(Question{
        question,
        QStringLiteral("[1-%1]").arg(count),
        [answer, count](const QString& line) {
            const auto choice = parse_choice(line, count);
            if (!choice) return false;
            answer(*choice);
            return true;
        },
        [answer]() { answer(std::nullopt); },
    });
}

void Prompt::post(Question question) {
    questions_.push_back(std::move(question));
    if (questions_.size() == 1) {
        showCurrent();
        notifier_->setEnabled(true);
    }
}

void Prompt::onReadable() {
    char chunk[512];
    const auto n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    if (n <= 0) {
        eof_ = true;
        notifier_->setEnabled(false);
        while (!questions_.empty()) {
            takeCurrent().give_up();
        }
        return;
    }

    buffer_.append(chunk, static_cast<qsizetype>(n));
    qsizetype newline = buffer_.indexOf('\n');
    while (newline >= 0) {
        const auto line = QString::fromUtf8(buffer_.left(newline));
        buffer_.remove(0, newline + 1);
        handleLine(line);
        newline = buffer_.indexOf('\n');
    }
}

void Prompt::handleLine(const QString& line) {
    if (questions_.empty()) {
        return;
    }
    // Copy: answering may post the next question.
    auto answer = questions_.front().answer;
    const auto hint = questions_.front().hint;
    if (!answer(line)) {
        out_ << "Please answer " << hint << ": " << Qt::flush;
        return;
    }
    takeCurrent();
}

void Prompt::showCurrent() {
    const auto& question = questions_.front();
    out_ << question.text << ' ' << question.hint << ' ' << Qt::flush;
}

Prompt::Question Prompt::takeCurrent() {
    auto question = std::move(questions_.front());
    questions_.pop_front();
    if (questions_.empty()) {
        notifier_->setEnabled(false);
    } else if (!eof_) {
        showCurrent();
    }
    return question;
}

} // namespace dropline::cli
