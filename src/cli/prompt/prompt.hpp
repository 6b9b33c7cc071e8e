#pragma once

#include <istream>
#include <ostream>
#include "../../infra/config/config.hpp"

namespace fdup::prompt {

/// Спрашивает все параметры запуска по одному.
/// Некорректный ответ переспрашивается, пустой ответ берёт значение по умолчанию.
/// Конец ввода до заполнения всех полей даёт InvalidInput.
[[nodiscard]] auto prompt_config(std::istream& in, std::ostream& out)
    -> infra::Result<infra::Config>;

} // namespace fdup::prompt
