#ifndef MEOWHNS_MAINWINDOW_HH
#define MEOWHNS_MAINWINDOW_HH

#include <QMainWindow>
#include <QLabel>
#include <QPushButton>
#include <QLineEdit>
#include <QPixmap>
#include <memory>
#include <optional>
#include "PhotoHnS.hh"

namespace Meow
{
    class MainWindow : public QMainWindow
    {
        Q_OBJECT
    public:
        explicit MainWindow(QWidget *parent = nullptr);
        ~MainWindow() override = default;

    private slots:
        void openContainer();
        void embedFile();
        void extractFile();

    private:
        void setupUi();
        void updateHeaderInfo(const std::optional<HeaderResolution>& resolution);
        void loadPreview(const QString& path);
        void showReport(const ExtractReport& report);

        QLabel       *previewLabel = nullptr;
        QLabel       *headerLabel  = nullptr;
        QLineEdit    *containerPathEdit = nullptr;
        QLineEdit    *payloadPathEdit   = nullptr;
        QPushButton  *extractBtn = nullptr;

        std::unique_ptr<PhotoHnS> hns;
        std::optional<HeaderResolution> currentHeader;  // set when the open image carries a MEOW header
        QString      currentContainerPath;
    };
} // Meow

#endif //MEOWHNS_MAINWINDOW_HH
