//gui.cpp
#include <QApplication>
#include <QWidget>
#include <QPushButton>
#include <QFileDialog>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGridLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QProcess>
#include <QCoreApplication>
#include <QComboBox>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProgressBar>
#include <QTextEdit>
#include <QGroupBox>
#include <QCheckBox>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>

class CompressorSettings {
public:
    static QString getConfigPath() {
        QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
        QDir dir(configDir);
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return dir.filePath("compressor_settings.json");
    }

    static bool save(const QString &lastDir, const QString &level, bool writeLog) {
        QJsonObject config;
        config["last_directory"] = lastDir;
        config["compression"] = level;
        config["write_log"] = writeLog;

        QJsonDocument doc(config);
        QFile file(getConfigPath());
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }
        file.write(doc.toJson());
        file.close();
        return true;
    }

    static bool load(QString &lastDir, QString &level, bool &writeLog) {
        QFile file(getConfigPath());
        if (!file.open(QIODevice::ReadOnly)) {
            return false;
        }

        QByteArray data = file.readAll();
        file.close();

        QJsonDocument doc = QJsonDocument::fromJson(data);
        if (!doc.isObject()) return false;

        QJsonObject config = doc.object();
        lastDir = config["last_directory"].toString();
        level = config["compression"].toString();
        writeLog = config["write_log"].toBool(true);
        return true;
    }
};

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName("FileCompressor");

    QWidget window;
    window.setWindowTitle("File Compression Utility");
    window.resize(600, 450);

    QVBoxLayout mainLayout;

    QGroupBox sourceGroup("Source File");
    QHBoxLayout sourceLayout;
    QLineEdit srcEdit;
    QPushButton srcBtn("Browse...");
    sourceLayout.addWidget(&srcEdit);
    sourceLayout.addWidget(&srcBtn);
    sourceGroup.setLayout(&sourceLayout);

    QGroupBox targetGroup("Compressed File");
    QHBoxLayout targetLayout;
    QLineEdit targetEdit;
    QPushButton targetBtn("Browse...");
    targetEdit.setPlaceholderText("Defaults to <source>.gz");
    targetLayout.addWidget(&targetEdit);
    targetLayout.addWidget(&targetBtn);
    targetGroup.setLayout(&targetLayout);

    QGroupBox optionsGroup("Options");
    QGridLayout optionsLayout;
    QLabel levelLabel("Compression level:");
    QComboBox levelCombo;
    levelCombo.addItems({"fast", "default", "best"});
    levelCombo.setCurrentText("default");
    QCheckBox logCheck("Write log.txt next to the compressed file");
    logCheck.setChecked(true);
    optionsLayout.addWidget(&levelLabel, 0, 0);
    optionsLayout.addWidget(&levelCombo, 0, 1);
    optionsLayout.addWidget(&logCheck, 1, 0, 1, 2);
    optionsGroup.setLayout(&optionsLayout);

    QHBoxLayout buttonLayout;
    QPushButton startBtn("Compress");
    QPushButton clearBtn("Clear Log");
    startBtn.setStyleSheet("QPushButton { background-color: #4CAF50; color: white; font-weight: bold; padding: 8px; }");
    buttonLayout.addWidget(&startBtn);
    buttonLayout.addWidget(&clearBtn);

    QProgressBar progressBar;
    progressBar.setVisible(false);

    QLabel logLabel("Output:");
    QTextEdit logText;
    logText.setReadOnly(true);

    mainLayout.addWidget(&sourceGroup);
    mainLayout.addWidget(&targetGroup);
    mainLayout.addWidget(&optionsGroup);
    mainLayout.addLayout(&buttonLayout);
    mainLayout.addWidget(&progressBar);
    mainLayout.addWidget(&logLabel);
    mainLayout.addWidget(&logText);

    QString lastDir = QDir::homePath();
    {
        QString level;
        bool writeLog = true;
        if (CompressorSettings::load(lastDir, level, writeLog)) {
            if (levelCombo.findText(level) >= 0) levelCombo.setCurrentText(level);
            logCheck.setChecked(writeLog);
        }
        if (lastDir.isEmpty()) lastDir = QDir::homePath();
    }

    QObject::connect(&srcBtn, &QPushButton::clicked, [&](){
        QString file = QFileDialog::getOpenFileName(&window, "Select File to Compress", lastDir);
        if (file.isEmpty()) return;
        srcEdit.setText(file);
        targetEdit.setText(file + ".gz");
        lastDir = QFileInfo(file).absolutePath();
    });

    QObject::connect(&targetBtn, &QPushButton::clicked, [&](){
        QString start = targetEdit.text().isEmpty() ? lastDir : targetEdit.text();
        QString file = QFileDialog::getSaveFileName(&window, "Save Compressed File", start, "Gzip Files (*.gz)");
        if (!file.isEmpty()) targetEdit.setText(file);
    });

    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);

    QObject::connect(&proc, &QProcess::readyRead, [&](){
        QString output = QString::fromUtf8(proc.readAll());
        logText.append(output.trimmed());
        logText.moveCursor(QTextCursor::End);
    });

    QObject::connect(&proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), &window,
                     [&](int code, QProcess::ExitStatus status){
        startBtn.setEnabled(true);
        progressBar.setVisible(false);

        if (status == QProcess::NormalExit && code == 0) {
            QMessageBox::information(&window, "Done", "Compression finished.");
        } else {
            logText.append(QString("Compression failed with exit code %1\n").arg(code));
            QMessageBox::critical(&window, "Compression failed", QString("Exit code %1").arg(code));
        }
    });

    QObject::connect(&startBtn, &QPushButton::clicked, [&](){
        QString src = srcEdit.text();
        QString target = targetEdit.text();

        if (src.isEmpty()) {
            QMessageBox::warning(&window, "Missing input", "Please select a file to compress.");
            return;
        }
        if (target.isEmpty()) {
            target = src + ".gz";
            targetEdit.setText(target);
        }

        QString binDir = QCoreApplication::applicationDirPath();
        QString cliPath = QDir(binDir).filePath("FileCompressor");

        if (!QFileInfo::exists(cliPath) || !QFileInfo(cliPath).isExecutable()) {
            QMessageBox::critical(&window, "CLI not found", QString("Could not find CLI at: %1").arg(cliPath));
            return;
        }

        QStringList args;
        args << "-q" << "-c" << levelCombo.currentText();
        QString logPath = logCheck.isChecked()
            ? QFileInfo(target).absoluteDir().filePath("log.txt")
            : QString("/dev/null");
        args << "--log-file" << logPath;
        args << src << target;

        if (!CompressorSettings::save(lastDir, levelCombo.currentText(), logCheck.isChecked())) {
            logText.append("Could not save settings.\n");
        }

        proc.setProgram(cliPath);
        proc.setArguments(args);

        startBtn.setEnabled(false);
        progressBar.setVisible(true);
        progressBar.setRange(0, 0);
        logText.append(QString("Compressing %1 -> %2 (%3)...\n").arg(src, target, levelCombo.currentText()));

        proc.start();
        if (!proc.waitForStarted(5000)) {
            QMessageBox::critical(&window, "Failed to start", QString("Could not start: %1").arg(cliPath));
            startBtn.setEnabled(true);
            progressBar.setVisible(false);
        }
    });

    QObject::connect(&clearBtn, &QPushButton::clicked, [&](){
        logText.clear();
    });

    window.setLayout(&mainLayout);
    window.show();
    return app.exec();
}
