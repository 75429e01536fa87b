#pragma once

namespace zipnum {

class App {
public:
  // 0 - успех, 1 - ошибка выполнения, 2 - ошибка аргументов/конфигурации
  int run(int argc, char** argv);
};

} // namespace zipnum
