/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include <QCoreApplication>
#include <QFile>
#include <QStringList>
#include <QTextStream>
#include <QtDebug>
#include <QFileInfo>
#include <QDir>
#include <QElapsedTimer>
#include <DspfParser.h>
#include <DspfHelper.h>
using namespace Dspf;

static QStringList collectFiles( const QDir& dir, const QStringList& suffix )
{
    QStringList res;
    QStringList files = dir.entryList( QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name );

    foreach( const QString& f, files )
        res += collectFiles( QDir( dir.absoluteFilePath(f) ), suffix );

    files = dir.entryList( suffix, QDir::Files, QDir::Name );
    foreach( const QString& f, files )
        res.append(dir.absoluteFilePath(f));
    return res;
}

static QString root;
static bool withCatalog = false;
static bool withSizes = false;

static QString indent(int level)
{
    QString ws;
    for( int i = 0; i < level; i++ )
        ws += "|  ";
    return ws;
}

static void dumpAttributes(QTextStream& out, const Element& e, int level)
{
    foreach( const Attribute& a, e.attributes )
    {
        out << indent(level) << a.text;
        const QString inds = Helper::formatIndicators(a.indicators);
        if( !inds.isEmpty() )
            out << " " << inds;
        out << "\t" << a.lineIndex + 1 << endl;
    }
}

static void dump(QTextStream& out, const Document& doc)
{
    foreach( const Element& e, doc.elements )
    {
        int level = 0;
        switch( e.kind )
        {
        case Element::FileDecl:
            out << "FILE" << endl;
            break;
        case Element::RecordDecl:
            level = 1;
            out << indent(level) << "RECORD " << e.name << "\t" << e.lineIndex + 1 << "-" << e.endLineIndex + 1;
            if( withSizes )
                out << "\t" << Helper::describeSize(e.size);
            out << endl;
            break;
        case Element::FieldDecl:
            level = 2;
            out << indent(level) << "FIELD " << e.name << " " << Helper::describeField(e);
            if( !e.indicators.isEmpty() )
                out << " " << Helper::formatIndicators(e.indicators);
            out << "\t" << e.lineIndex + 1 << endl;
            break;
        case Element::ConstDecl:
            level = 2;
            out << indent(level) << "CONST " << e.name << " " << Helper::describeConstant(e);
            if( !e.indicators.isEmpty() )
                out << " " << Helper::formatIndicators(e.indicators);
            out << "\t" << e.lineIndex + 1 << endl;
            break;
        default:
            continue;
        }
        dumpAttributes(out, e, level + 1);
    }
    if( withSizes )
    {
        out << "default size " << Helper::describeSize(doc.defaultSize) << endl;
        if( doc.alternateSize.isValid() )
            out << "alternate size " << Helper::describeSize(doc.alternateSize) << endl;
    }
}

static void dumpCatalog(QTextStream& out, const Catalog& cat)
{
    foreach( const RecordEntry& r, cat )
    {
        out << r.name << "\t" << r.startLine + 1 << "-" << r.endLine + 1;
        if( r.subfile )
            out << " SFL";
        out << endl;
        foreach( const FieldInfo& f, r.fields )
            out << indent(1) << "field " << f.name << " " << f.row << "," << f.col << " " << f.length << endl;
        foreach( const ConstantInfo& c, r.constants )
            out << indent(1) << "const '" << c.name << "' " << c.row << "," << c.col << endl;
        foreach( const Helper::Overlap& o, Helper::findOverlaps(r) )
            out << indent(1) << "overlap " << o.first << " " << o.second << " on row " << o.row << endl;
    }
}

static int checkParser(const QStringList& files)
{
    int ok = 0;
    QTextStream out(stdout);
    QElapsedTimer timer;
    timer.start();
    foreach( const QString& file, files )
    {
        QFile in(file);
        if( !in.open(QIODevice::ReadOnly) )
        {
            qCritical() << "cannot open file" << file << in.errorString();
            continue;
        }
        qDebug() << "**** parsing" << (root.isEmpty() ? file : file.mid(root.size()+1));
        const Document doc = Parser::parseDocument(QString::fromUtf8(in.readAll()));
        dump(out, doc);
        if( withCatalog )
            dumpCatalog(out, doc.catalog);
        out.flush();
        ok++;
    }
    qDebug() << "#### finished with" << ok << "files ok of total" << files.size() << "files" << "in" << timer.elapsed() << " [ms]";
    return files.size() - ok;
}

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);

    QString path;
    for( int i = 1; i < a.arguments().size(); i++ )
    {
        const QString arg = a.arguments()[i];
        if( arg == "-catalog" )
            withCatalog = true;
        else if( arg == "-sizes" )
            withSizes = true;
        else if( arg.startsWith('-') )
        {
            qCritical() << "unknown option" << arg;
            return -1;
        }else
            path = arg;
    }
    if( path.isEmpty() )
    {
        qCritical() << "usage: DspfDump [-catalog] [-sizes] <file or directory>";
        return -1;
    }

    QStringList files;
    QFileInfo info(path);
    if( info.isDir() )
    {
        files = collectFiles(info.filePath(), QStringList() << "*.dspf");
        root = info.filePath();
    }else
        files.append(info.filePath());

    return checkParser(files) == 0 ? 0 : 1;
}
