#include "speech/NarrationGenerator.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace
{

std::string formatAmount(double amount)
{
    std::ostringstream oss;
    if (std::floor(amount) == amount)
    {
        oss << static_cast<long long>(amount);
    }
    else
    {
        oss.setf(std::ios::fixed);
        oss.precision(2);
        oss << amount;
    }
    return oss.str();
}

std::string displayName(const StreamEvent &event)
{
    return event.actorName.empty() ? event.actor : event.actorName;
}

} // namespace

TemplateNarrator::TemplateNarrator(std::uint32_t seed) : m_rng(seed)
{
    m_phrases["kill"] = {"Красиво!", "Отличный выстрел!", "Так держать!", "Круто!", "Есть!",
                         "Чисто!", "Без шансов!", "Разобрался!", "Фраг в копилку!", "Уложил!"};
    m_phrases["death"] = {"Бывает...", "Ничего, в следующий раз!", "Отомстим!", "Упс...", "Не расстраивайся!",
                          "Не повезло...", "Жёстко...", "Такое случается", "Держись!", "Соберись!"};
    m_phrases["round_end"] = {"Хороший раунд!", "Продолжаем!", "Дальше будет лучше!", "Неплохо!",
                              "Отлично сыграно!", "Команда молодец!", "Работаем дальше!", "Счёт пошёл!"};
    m_phrases["bomb_planted"] = {"Бомба заложена! Напряжёнка!", "Бомба на точке! Время пошло!",
                                 "Заложили! Защищаем!", "Бомба установлена! Контролируем!"};
    m_phrases["bomb_defused"] = {"Бомба обезврежена! Красавцы!", "Дефуз! Отлично сработано!", "Спасли раунд!",
                                 "Обезвредили! Молодцы!"};
    m_phrases["bomb_exploded"] = {"Бомба взорвалась...", "Взрыв! Следующий раунд.", "Не успели...", "Взорвалось..."};
    m_phrases["ace"] = {"Это эйс! Всю команду в одиночку!", "Эйс! Невероятно!", "Пятерых уложил! Легенда!"};
    m_phrases["clutch"] = {"Клатч! Вытащил раунд в одиночку!", "Какой клатч! Нервы из стали!"};
    m_phrases["mvp"] = {"MVP раунда! Заслуженно!", "Лучший игрок раунда!"};
    m_phrases["low_health"] = {"Осторожно, мало здоровья!", "Аккуратнее, ты на последнем издыхании!"};
    m_phrases["match_end"] = {"Матч окончен! Отличная игра!", "Вот и всё, матч завершён!"};
    m_phrases["donation"] = {"Спасибо за донат!", "Благодарю за поддержку!", "Вау, спасибо!", "Огромное спасибо!",
                             "Ценим поддержку!", "Спасибо, очень приятно!"};
    m_phrases["subscription"] = {"Спасибо за подписку!", "Добро пожаловать в семью!"};
    m_phrases["raid"] = {"К нам рейд! Всем привет!", "Рейд! Добро пожаловать!"};
    m_phrases["follow"] = {"Спасибо за фоллоу!", "Рада новому зрителю!"};
    m_phrases["chat"] = {"Привет!", "Спасибо за сообщение!", "Рада видеть!", "Здаров!", "Как дела?",
                         "Добро пожаловать!"};
    m_phrases["ambient"] = {"Как вам игра?", "Не забывайте пить воду!", "Хороший стрим сегодня!",
                            "Интересно, что будет дальше."};
    m_phrases["conversation"] = {"Да? Слушаю!", "Я тут!", "Слушаю тебя!", "Что такое?"};
    m_defaultPhrases = {"Ок!", "Понятно!", "Хорошо!"};
}

void TemplateNarrator::setPhrases(const std::string &category, std::vector<std::string> phrases)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (phrases.empty())
    {
        m_phrases.erase(category);
        return;
    }
    m_phrases[category] = std::move(phrases);
}

const std::string &TemplateNarrator::pick(const std::vector<std::string> &phrases)
{
    std::uniform_int_distribution<std::size_t> dist(0, phrases.size() - 1);
    return phrases[dist(m_rng)];
}

std::string TemplateNarrator::phrase(const NarrationPrompt &prompt)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_phrases.find(prompt.category);
    std::string base = pick(it == m_phrases.end() ? m_defaultPhrases : it->second);

    const StreamEvent &event = prompt.event;
    const std::string name = displayName(event);
    if (prompt.category == "donation" && !name.empty())
    {
        std::string line = name + ", " + base;
        if (event.amount > 0.0)
        {
            line += " " + formatAmount(event.amount);
            if (!event.currency.empty())
            {
                line += " " + event.currency;
            }
            line += "!";
        }
        return line;
    }
    if ((prompt.category == "subscription" || prompt.category == "follow" || prompt.category == "chat") &&
        !name.empty())
    {
        return name + ", " + base;
    }
    if (prompt.category == "raid" && !name.empty())
    {
        return base + " Рейд от " + name + ", " + std::to_string(event.count) + " зрителей!";
    }
    return base;
}

std::optional<std::string> TemplateNarrator::generate(const NarrationPrompt &prompt)
{
    return phrase(prompt);
}
