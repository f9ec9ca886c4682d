#include "MainWindow.hh"

#include <QApplication>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGridLayout>
#include <QGroupBox>
#include <QFile>
#include <QFileDialog>
#include <QMessageBox>
#include <QScrollArea>
#include <QFileInfo>
#include <QStandardPaths>
#include <QStatusBar>
#include <iomanip>
#include <sstream>

namespace Meow
{
    MainWindow::MainWindow(QWidget *parent) : QMainWindow(parent), hns(std::make_unique<PhotoHnS>())
    {
        setWindowTitle("MeowHnS");
        resize(1000, 700);
        setupUi();
        statusBar()->showMessage(QString("Ready (%1)").arg(QString::fromStdString(detect_block_codec().name())));

        qApp->setStyle("Fusion");
        QPalette darkPalette;
        darkPalette.setColor(QPalette::Window,          QColor(30, 30, 30));
        darkPalette.setColor(QPalette::WindowText,      Qt::white);
        darkPalette.setColor(QPalette::Base,            QColor(25, 25, 25));
        darkPalette.setColor(QPalette::AlternateBase,   QColor(35, 35, 35));
        darkPalette.setColor(QPalette::Text,            Qt::white);
        darkPalette.setColor(QPalette::Button,          QColor(45, 45, 45));
        darkPalette.setColor(QPalette::ButtonText,      Qt::white);
        darkPalette.setColor(QPalette::BrightText,      Qt::red);
        darkPalette.setColor(QPalette::Highlight,       QColor(42, 130, 218));
        qApp->setPalette(darkPalette);

        setStyleSheet(R"(
            QLabel { color: #d4d4d4; }
            QPushButton { background-color: #007acc; border: none; padding: 8px; border-radius: 4px; }
            QPushButton:hover { background-color: #148cd2; }
            QPushButton:disabled { background-color: #3c3c3c; }
            QLineEdit { background-color: #3c3c3c; border: 1px solid #555; padding: 6px; }
        )");
    }

    void MainWindow::setupUi()
    {
        auto *central = new QWidget(this);
        setCentralWidget(central);
        auto *mainLayout = new QVBoxLayout(central);

        // ── Container ──────────────────────────────────────────
        auto *topBox = new QGroupBox("Container (image)");
        auto *topLayout = new QHBoxLayout(topBox);
        containerPathEdit = new QLineEdit;
        containerPathEdit->setReadOnly(true);
        auto *openBtn = new QPushButton("Open container...");
        connect(openBtn, &QPushButton::clicked, this, &MainWindow::openContainer);
        topLayout->addWidget(containerPathEdit);
        topLayout->addWidget(openBtn);
        mainLayout->addWidget(topBox);

        // ── Preview ────────────────────────────────────────────
        previewLabel = new QLabel("Open an image");
        previewLabel->setAlignment(Qt::AlignCenter);
        previewLabel->setMinimumHeight(400);
        previewLabel->setStyleSheet("background-color: #1e1e1e; border: 1px solid #444;");
        auto *scroll = new QScrollArea;
        scroll->setWidgetResizable(true);
        scroll->setWidget(previewLabel);
        mainLayout->addWidget(scroll, 1);

        // ── Header ─────────────────────────────────────────────
        auto *headerBox = new QGroupBox("MEOW header");
        auto *headerLayout = new QVBoxLayout(headerBox);
        headerLabel = new QLabel("Header: none");
        headerLabel->setWordWrap(true);
        headerLabel->setStyleSheet("font-family: Consolas; background: #252526; padding: 12px;");
        headerLayout->addWidget(headerLabel);
        mainLayout->addWidget(headerBox);

        // ── Actions ────────────────────────────────────────────
        auto *actionsBox = new QGroupBox("Actions");
        auto *actionsLayout = new QGridLayout(actionsBox);

        payloadPathEdit = new QLineEdit;
        payloadPathEdit->setReadOnly(true);
        auto *choosePayloadBtn = new QPushButton("Choose file to hide...");
        connect(choosePayloadBtn, &QPushButton::clicked, this, [this]{
            QString path = QFileDialog::getOpenFileName(this, "Choose file");
            if (!path.isEmpty()) {
                payloadPathEdit->setText(path);
            }
        });

        auto *embedBtn = new QPushButton("Embed → new PNG");
        connect(embedBtn, &QPushButton::clicked, this, &MainWindow::embedFile);

        extractBtn = new QPushButton("Extract hidden file");
        extractBtn->setEnabled(false);            // enabled once a header is found
        connect(extractBtn, &QPushButton::clicked, this, &MainWindow::extractFile);

        actionsLayout->addWidget(new QLabel("File to hide:"), 0, 0);
        actionsLayout->addWidget(payloadPathEdit, 0, 1);
        actionsLayout->addWidget(choosePayloadBtn, 0, 2);
        actionsLayout->addWidget(embedBtn, 1, 0, 1, 3);
        actionsLayout->addWidget(extractBtn, 2, 0, 1, 3);

        mainLayout->addWidget(actionsBox);
    }

    void MainWindow::openContainer()
    {
        QString path = QFileDialog::getOpenFileName(this, "Open container", "",
                                                    "Images (*.png *.bmp *.tga *.jpg *.jpeg)");
        if (path.isEmpty()) return;

        currentContainerPath = path;
        containerPathEdit->setText(path);
        loadPreview(path);
        updateHeaderInfo(HnS::readHeaderOnly(path.toStdString()));
    }

    void MainWindow::loadPreview(const QString& path)
    {
        QPixmap pix(path);
        if (pix.isNull()) {
            previewLabel->setText("Failed to load image");
            return;
        }
        previewLabel->setPixmap(pix.scaled(previewLabel->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
    }

    void MainWindow::updateHeaderInfo(const std::optional<HeaderResolution>& resolution)
    {
        currentHeader = resolution;
        extractBtn->setEnabled(resolution.has_value());
        if (!resolution.has_value()) {
            headerLabel->setText("Header: none");
            return;
        }

        const Header& header = resolution->header;
        std::ostringstream oss;
        oss << "Payload size: " << header.payload_length << " bytes\n"
            << "Mode: " << (header.ecc ? "Reed-Solomon (255,223)" : "raw") << "\n"
            << "Checksum: 0x" << std::hex << std::setw(8) << std::setfill('0') << header.checksum << std::dec << "\n"
            << "Read from: " << to_string(resolution->source) << " copy";
        if (resolution->alternate)
            oss << " (copies disagree)";

        headerLabel->setText(QString::fromStdString(oss.str()));
    }

    void MainWindow::showReport(const ExtractReport& report)
    {
        std::ostringstream oss;
        oss << to_string(report.state);
        if (report.state != RecoveryState::Success)
            oss << ": " << to_string(report.reason);
        oss << ", corrected " << report.corrected_symbols << " symbols";
        if (!report.failed_blocks.empty())
            oss << ", " << report.failed_blocks.size() << "/" << report.blocks.size() << " blocks lost";
        if (report.checksum_mismatch)
            oss << ", checksum mismatch";
        if (report.recovered_from_secondary())
            oss << ", secondary header";
        statusBar()->showMessage(QString::fromStdString(oss.str()));
    }

    void MainWindow::embedFile()
    {
        if (currentContainerPath.isEmpty() || payloadPathEdit->text().isEmpty()) {
            QMessageBox::warning(this, "Error", "Select container and file to hide");
            return;
        }

        QFile file(payloadPathEdit->text());
        if (!file.open(QIODevice::ReadOnly)) {
            QMessageBox::critical(this, "Error", "Cannot read file");
            return;
        }
        QByteArray payloadData = file.readAll();
        std::vector<byte> data(
            reinterpret_cast<const byte*>(payloadData.constData()),
            reinterpret_cast<const byte*>(payloadData.constData() + payloadData.size())
        );

        QString savePath = QFileDialog::getSaveFileName(this, "Save container", "", "PNG (*.png)");
        if (savePath.isEmpty()) return;

        auto result = hns->embed(data, currentContainerPath.toStdString(), savePath.toStdString());
        if (!result) {
            QMessageBox::critical(this, "Error", "File error");
            return;
        }
        if (!result->ok()) {
            QMessageBox::critical(this, "Error",
                                  QString("%1: needs %2 bits, image has %3")
                                      .arg(QString::fromLatin1(to_string(result->error)))
                                      .arg(result->bits_required)
                                      .arg(result->bits_available));
            return;
        }

        QMessageBox::information(this, "Success",
                                 result->ecc_applied() ? "Data embedded with Reed-Solomon protection"
                                                       : "Data embedded in raw mode (no error correction)");
        currentContainerPath = savePath;
        containerPathEdit->setText(savePath);
        loadPreview(savePath);
        updateHeaderInfo(hns->read_header_only(savePath.toStdString()));
    }

    void MainWindow::extractFile()
    {
        if (!currentHeader || currentContainerPath.isEmpty()) return;

        QString savePath = QFileDialog::getSaveFileName(this,
            "Extract file", QStandardPaths::writableLocation(QStandardPaths::DesktopLocation));
        if (savePath.isEmpty()) return;

        auto report = hns->extract(currentContainerPath.toStdString());
        if (!report) {
            QMessageBox::critical(this, "Error", "Failed to read container");
            return;
        }
        showReport(*report);
        if (report->state == RecoveryState::Failed) {
            QMessageBox::critical(this, "Error", QString("Recovery failed: %1").arg(QString::fromLatin1(to_string(report->reason))));
            return;
        }

        QFile file(savePath);
        if (!file.open(QIODevice::WriteOnly)) {
            QMessageBox::critical(this, "Error", "Failed to write file");
            return;
        }
        file.write(reinterpret_cast<const char*>(report->payload.data()), static_cast<qint64>(report->payload.size()));

        if (report->state == RecoveryState::PartialSuccess)
            QMessageBox::warning(this, "Partial", "Some data could not be recovered, the file is incomplete");
        else
            QMessageBox::information(this, "Done", "File extracted");
    }
} // Meow
