#pragma once

#include <QObject>
#include <QSocketNotifier>
#include <QString>
#include <QTextStream>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace dropline::cli {

/**
 * "y", "yes", "n", "no" (any case, surrounding whitespace ignored).
 */
[[nodiscard]] std::optional<bool> parse_yes_no(const QString& text);

/**
 * A 1-based choice out of `count` ("2" -> 1). Nothing for anything else.
 */
[[nodiscard]] std::optional<size_t> parse_choice(const QString& text, size_t count);

/**
 * Prompt - Questions answered on stdin without blocking the event loop.
 *
 * Questions are asked one at a time in the order they were posed. When
 * stdin closes every open question is answered "no" (or no choice).
 */
class Prompt : public QObject {
    Q_OBJECT

public:
    explicit Prompt(QTextStream& out, QObject* parent = nullptr);
    ~Prompt() override;

    void ask(const QString& question, std::function<void(bool)> answer);

    /**
     * Pick one of `count` numbered options; `answer` gets the 0-based index.
     */
    void askChoice(const QString& question, size_t count,
                   std::function<void(std::optional<size_t>)> answer);

    [[nodiscard]] size_t pending() const { return questions_.size(); }

private slots:
    void onReadable();

private:
    struct Question {
        QString text;
        QString hint;    // shown after the text and on a bad answer
        // Takes a line; false when it is not an answer.
        std::function<bool(const QString&)> answer;
        std::function<void()> give_up;
    };

    QTextStream& out_;
    std::unique_ptr<QSocketNotifier> notifier_;
    std::deque<Question> questions_;
    QByteArray buffer_;
    bool eof_ = false;

    void post(Question question);
    void showCurrent();
    Question takeCurrent();
    void handleLine(const QString& line);
};

} // namespace dropline::cli
