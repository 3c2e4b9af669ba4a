#include "LedgerApp.hpp"
#include <iostream>

/**
 * @brief Перенаправляет std::cout на время жизни объекта
 *
 * Диагностика компонентов пишется в std::cout, а результат команды
 * должен остаться единственным содержимым stdout.
 */
class CoutRedirect
{
public:
    explicit CoutRedirect(std::streambuf* target)
        : original_(std::cout.rdbuf(target))
    {
    }

    ~CoutRedirect()
    {
        std::cout.rdbuf(original_);
    }

    std::streambuf* original() const { return original_; }

private:
    std::streambuf* original_;
};

int main(int argc, char* argv[])
{
    CoutRedirect redirect(std::clog.rdbuf());
    std::ostream out(redirect.original());

    try
    {
        LedgerApp app;

        // Template Method:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. handle(args)
        return app.run(argc, argv, out);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
