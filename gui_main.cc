#include <QApplication>
#include "MainWindow.hh"

int main(int argc, char** argv)
{
    QApplication app(argc, argv);
    Meow::MainWindow window;
    window.show();
    return app.exec();
}
